#pragma once

#include <expected>
#include <string>
#include <vector>

#include "imgfetch/image/img_buffer.hpp"


namespace imgfetch {

    // Output is gray, RGB or CMYK. YCbCr is converted to RGB by libjpeg.
    std::expected<ImageBuffer, std::string> decode_jpeg(
        const uint8_t* data, size_t size
    );

    // Accepts gray and RGB buffers. `quality` is clamped to [1, 100].
    std::expected<std::vector<uint8_t>, std::string> encode_jpeg(
        const ImageBuffer& img, int quality
    );

}  // namespace imgfetch
