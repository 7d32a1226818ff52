#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>


namespace imgfetch {

    enum class PixelFormat {
        gray,
        gray_alpha,
        rgb,
        rgba,
        cmyk,
    };

    int channel_count(PixelFormat format);

    const char* to_str(PixelFormat format);


    // Upper bound for any buffer a resize produces, 1 GiB as RGBA
    constexpr size_t MAX_PIXEL_COUNT = size_t{ 1 } << 28;

    inline bool fits_pixel_limit(int width, int height) {
        if (width <= 0 || height <= 0)
            return false;
        const auto count = static_cast<size_t>(width) *
                           static_cast<size_t>(height);
        return count <= MAX_PIXEL_COUNT;
    }


    // 8 bits per channel, row-major, rows tightly packed
    struct ImageBuffer {
        int channels() const { return channel_count(format); }

        size_t row_bytes() const {
            return static_cast<size_t>(width) * channels();
        }

        bool is_valid() const {
            return width > 0 && height > 0 &&
                   pixels.size() == row_bytes() * static_cast<size_t>(height);
        }

        const uint8_t* row(int y) const {
            return pixels.data() + row_bytes() * static_cast<size_t>(y);
        }

        uint8_t* row(int y) {
            return pixels.data() + row_bytes() * static_cast<size_t>(y);
        }

        void allocate(int w, int h, PixelFormat f) {
            width = w;
            height = h;
            format = f;
            pixels.assign(row_bytes() * static_cast<size_t>(h), 0);
        }

        int width = 0;
        int height = 0;
        PixelFormat format = PixelFormat::rgb;
        // Adobe APP14 JPEGs store CMYK inverted
        bool cmyk_inverted = false;
        std::vector<uint8_t> pixels;
    };


    // Any layout to 3-channel RGB. Alpha is discarded, not composited.
    std::expected<ImageBuffer, std::string> to_rgb(const ImageBuffer& src);

}  // namespace imgfetch
