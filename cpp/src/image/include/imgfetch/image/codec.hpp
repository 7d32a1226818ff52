#pragma once

#include <expected>
#include <string>
#include <vector>

#include "imgfetch/image/avif.hpp"
#include "imgfetch/image/img_buffer.hpp"
#include "imgfetch/image/simple_img_info.hpp"


namespace imgfetch {

    struct EncodeOptions {
        int jpeg_quality = 75;
        AvifEncodeParams avif;
    };


    // Format is sniffed from the content, never from a name or URL
    std::expected<ImageBuffer, std::string> decode_image(
        const uint8_t* data, size_t size
    );

    std::expected<std::vector<uint8_t>, std::string> encode_image(
        const ImageBuffer& img,
        const ImageFormat format,
        const EncodeOptions& options
    );

}  // namespace imgfetch
