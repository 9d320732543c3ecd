#pragma once

#include "peerlink/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace peerlink {

/**
 * @brief Standard (RFC 4648) base64 with '=' padding, backed by libsodium
 *
 * The output alphabet is clipboard- and QR-safe. Decoding skips ASCII
 * whitespace so codes that were wrapped or indented when pasted still decode;
 * any other character outside the alphabet rejects the input.
 */
std::string base64_encode(const std::uint8_t* data, std::size_t size);
std::string base64_encode(const Bytes& data);
std::string base64_encode(std::string_view text);

std::optional<Bytes> base64_decode(std::string_view encoded);

} // namespace peerlink
