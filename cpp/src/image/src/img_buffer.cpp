#include "imgfetch/image/img_buffer.hpp"


namespace {

    uint8_t cmyk_channel_to_rgb(int v, int k, bool inverted) {
        if (inverted) {
            // Adobe stores 255 - value
            return static_cast<uint8_t>((v * k + 127) / 255);
        }
        return static_cast<uint8_t>(((255 - v) * (255 - k) + 127) / 255);
    }

}  // namespace


namespace imgfetch {

    int channel_count(PixelFormat format) {
        switch (format) {
            case PixelFormat::gray:
                return 1;
            case PixelFormat::gray_alpha:
                return 2;
            case PixelFormat::rgb:
                return 3;
            case PixelFormat::rgba:
            case PixelFormat::cmyk:
                return 4;
        }
        return 0;
    }

    const char* to_str(PixelFormat format) {
        switch (format) {
            case PixelFormat::gray:
                return "gray";
            case PixelFormat::gray_alpha:
                return "gray_alpha";
            case PixelFormat::rgb:
                return "rgb";
            case PixelFormat::rgba:
                return "rgba";
            case PixelFormat::cmyk:
                return "cmyk";
        }
        return "unknown";
    }

    std::expected<ImageBuffer, std::string> to_rgb(const ImageBuffer& src) {
        if (!src.is_valid())
            return std::unexpected("Invalid image buffer");

        if (src.format == PixelFormat::rgb)
            return src;

        ImageBuffer out;
        out.allocate(src.width, src.height, PixelFormat::rgb);

        const size_t pixel_count = static_cast<size_t>(src.width) *
                                   static_cast<size_t>(src.height);
        const auto src_ch = static_cast<size_t>(src.channels());
        const uint8_t* in = src.pixels.data();
        uint8_t* dst = out.pixels.data();

        for (size_t i = 0; i < pixel_count; ++i) {
            const uint8_t* p = in + i * src_ch;
            uint8_t* q = dst + i * 3;

            switch (src.format) {
                case PixelFormat::gray:
                case PixelFormat::gray_alpha:
                    q[0] = q[1] = q[2] = p[0];
                    break;
                case PixelFormat::rgba:
                    q[0] = p[0];
                    q[1] = p[1];
                    q[2] = p[2];
                    break;
                case PixelFormat::cmyk: {
                    const bool inv = src.cmyk_inverted;
                    q[0] = ::cmyk_channel_to_rgb(p[0], p[3], inv);
                    q[1] = ::cmyk_channel_to_rgb(p[1], p[3], inv);
                    q[2] = ::cmyk_channel_to_rgb(p[2], p[3], inv);
                    break;
                }
                case PixelFormat::rgb:
                    break;
            }
        }

        return out;
    }

}  // namespace imgfetch
