#pragma once

#include "peerlink/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace peerlink::qr {

/**
 * @brief Grayscale bitmap, row-major, one byte of luma per pixel
 */
struct RasterImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> pixels;
};

/**
 * @brief Turns a connection code into a scannable image
 *
 * The peer core never encodes QR symbols itself; the UI layer plugs in
 * whatever encoder it ships with. A code too long for the encoder should come
 * back as InvalidArgument.
 */
class QrRenderer {
public:
    virtual ~QrRenderer() = default;

    virtual Result<RasterImage> render(const std::string& text) const = 0;
};

} // namespace peerlink::qr
