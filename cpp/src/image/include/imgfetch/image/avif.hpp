#pragma once

#include <expected>
#include <string>
#include <vector>

#include <avif/avif.h>

#include "imgfetch/image/img_buffer.hpp"


namespace imgfetch {

    struct AvifEncodeParams {

    public:
        AvifEncodeParams();

        avifPixelFormat yuv_format() const;
        double quality() const;
        int speed() const;

        // Map "quality [0, 100]" → AV1 quantizer [0, 63] (0 best, 63 worst)
        int calc_quantizer() const;

        void set_yuv_format(avifPixelFormat f);
        // [0, 100]
        void set_quality(double q);
        // [0, 10]
        void set_speed(int s);

    private:
        avifPixelFormat yuv_format_;
        double quality_;
        int speed_;
    };


    // First frame only, output is 8-bit RGBA
    std::expected<ImageBuffer, std::string> decode_avif(
        const uint8_t* data, size_t size
    );

    // Accepts RGB and RGBA buffers
    std::expected<std::vector<uint8_t>, std::string> encode_avif(
        const ImageBuffer& img, const AvifEncodeParams& params
    );

}  // namespace imgfetch
