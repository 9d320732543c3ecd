#include "peerlink/core/base64.hpp"

#include <sodium.h>

#include <vector>

namespace peerlink {

std::string base64_encode(const std::uint8_t* data, std::size_t size) {
    // Encoded length includes the trailing NUL written by libsodium.
    std::vector<char> encoded(sodium_base64_encoded_len(size, sodium_base64_VARIANT_ORIGINAL));
    sodium_bin2base64(encoded.data(), encoded.size(), data, size, sodium_base64_VARIANT_ORIGINAL);
    return std::string(encoded.data());
}

std::string base64_encode(const Bytes& data) {
    return base64_encode(data.data(), data.size());
}

std::string base64_encode(std::string_view text) {
    return base64_encode(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

std::optional<Bytes> base64_decode(std::string_view encoded) {
    Bytes decoded(encoded.size() / 4 * 3 + 3);
    std::size_t decoded_len = 0;

    // Null end pointer: anything left after the padding rejects the input.
    const int result = sodium_base642bin(decoded.data(), decoded.size(),
                                         encoded.data(), encoded.size(),
                                         " \r\n\t", &decoded_len, nullptr,
                                         sodium_base64_VARIANT_ORIGINAL);
    if (result != 0) {
        return std::nullopt;
    }
    decoded.resize(decoded_len);
    return decoded;
}

} // namespace peerlink
