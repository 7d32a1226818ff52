#include "imgfetch/image/codec.hpp"

#include <format>

#include "imgfetch/image/jpeg.hpp"
#include "imgfetch/image/png.hpp"


namespace imgfetch {

    std::expected<ImageBuffer, std::string> decode_image(
        const uint8_t* data, size_t size
    ) {
        const auto info = get_simple_img_info(data, size);
        if (!info)
            return std::unexpected("Unrecognized image data");

        switch (info->format()) {
            case ImageFormat::png:
                return decode_png(data, size);
            case ImageFormat::jpeg:
                return decode_jpeg(data, size);
            case ImageFormat::avif:
                return decode_avif(data, size);
            case ImageFormat::unknown:
                break;
        }

        return std::unexpected(
            std::format("Unsupported image type: {}", info->mime_type_)
        );
    }

    std::expected<std::vector<uint8_t>, std::string> encode_image(
        const ImageBuffer& img,
        const ImageFormat format,
        const EncodeOptions& options
    ) {
        switch (format) {
            case ImageFormat::png:
                return encode_png(img);
            case ImageFormat::jpeg:
                return encode_jpeg(img, options.jpeg_quality);
            case ImageFormat::avif:
                return encode_avif(img, options.avif);
            case ImageFormat::unknown:
                break;
        }

        return std::unexpected("Cannot determine output format");
    }

}  // namespace imgfetch
