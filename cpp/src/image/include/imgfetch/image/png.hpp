#pragma once

#include <expected>
#include <string>
#include <vector>

#include "imgfetch/image/img_buffer.hpp"


namespace imgfetch {

    // Output is 8-bit gray, gray+alpha, RGB or RGBA. Palette, low bit gray
    // and tRNS are expanded, 16-bit is stripped.
    std::expected<ImageBuffer, std::string> decode_png(
        const uint8_t* data, size_t size
    );

    // Accepts gray, gray+alpha, RGB and RGBA buffers
    std::expected<std::vector<uint8_t>, std::string> encode_png(
        const ImageBuffer& img
    );

}  // namespace imgfetch
