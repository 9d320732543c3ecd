#pragma once

#include <cstdint>
#include <vector>

namespace peerlink {

using Bytes = std::vector<std::uint8_t>;

} // namespace peerlink
