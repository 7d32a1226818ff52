#include "imgfetch/image/avif.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

#include <avif/avif.h>


namespace {

    class AvifDecoder {

    public:
        AvifDecoder() : decoder_(avifDecoderCreate()) {}

        ~AvifDecoder() { this->destroy(); }

        AvifDecoder(const AvifDecoder&) = delete;
        AvifDecoder& operator=(const AvifDecoder&) = delete;

        void destroy() {
            if (decoder_) {
                avifDecoderDestroy(decoder_);
                decoder_ = nullptr;
            }
        }

        bool is_valid() const { return decoder_ != nullptr; }

        avifResult set_io_memory(const uint8_t* data, size_t size) {
            return avifDecoderSetIOMemory(decoder_, data, size);
        }

        avifResult parse() { return avifDecoderParse(decoder_); }

        avifResult next_image() { return avifDecoderNextImage(decoder_); }

        const avifImage* image() const {
            if (!decoder_)
                return nullptr;
            return decoder_->image;
        }

    private:
        avifDecoder* decoder_;
    };


    class AvifEncoder {

    public:
        AvifEncoder() : encoder_(avifEncoderCreate()) {}

        ~AvifEncoder() {
            avifRWDataFree(&output_);
            if (encoder_)
                avifEncoderDestroy(encoder_);
            if (image_)
                avifImageDestroy(image_);
        }

        AvifEncoder(const AvifEncoder&) = delete;
        AvifEncoder& operator=(const AvifEncoder&) = delete;

        std::expected<std::vector<uint8_t>, std::string> encode(
            const imgfetch::ImageBuffer& src,
            const imgfetch::AvifEncodeParams& params
        ) {
            if (!encoder_)
                return std::unexpected("avifEncoderCreate failed");

            image_ = avifImageCreate(
                static_cast<uint32_t>(src.width),
                static_cast<uint32_t>(src.height),
                8,  // bit depth
                params.yuv_format()
            );
            if (!image_)
                return std::unexpected("avifImageCreate failed");

            const bool has_alpha = src.format == imgfetch::PixelFormat::rgba;
            image_->alphaPremultiplied = AVIF_FALSE;

            avifRGBImage rgb;
            avifRGBImageSetDefaults(&rgb, image_);
            rgb.depth = 8;
            rgb.format = has_alpha ? AVIF_RGB_FORMAT_RGBA : AVIF_RGB_FORMAT_RGB;
            rgb.pixels = const_cast<uint8_t*>(src.pixels.data());
            rgb.rowBytes = static_cast<uint32_t>(src.row_bytes());

            auto res = avifImageRGBToYUV(image_, &rgb);
            if (res != AVIF_RESULT_OK)
                return std::unexpected(avifResultToString(res));

            encoder_->minQuantizer = params.calc_quantizer();
            // constant quality for simplicity
            encoder_->maxQuantizer = encoder_->minQuantizer;
            encoder_->speed = params.speed();

            res = avifEncoderWrite(encoder_, image_, &output_);
            if (res != AVIF_RESULT_OK)
                return std::unexpected(avifResultToString(res));

            return std::vector<uint8_t>(
                output_.data, output_.data + output_.size
            );
        }

    private:
        avifEncoder* encoder_;
        avifImage* image_ = nullptr;
        avifRWData output_ = AVIF_DATA_EMPTY;
    };

}  // namespace


// AvifEncodeParams
namespace imgfetch {

    AvifEncodeParams::AvifEncodeParams()
        : yuv_format_(AVIF_PIXEL_FORMAT_YUV444), quality_(70), speed_(6) {}

    avifPixelFormat AvifEncodeParams::yuv_format() const { return yuv_format_; }

    double AvifEncodeParams::quality() const { return quality_; }

    int AvifEncodeParams::speed() const { return speed_; }

    int AvifEncodeParams::calc_quantizer() const {
        constexpr double gamma = 1.6;

        double q = (100.0 - quality_) / 100.0;  // 0..1 (0 = best)
        q = std::pow(q, gamma);

        int quant = int(std::round(63.0 * q));
        return std::clamp(quant, 0, 63);
    }

    void AvifEncodeParams::set_yuv_format(avifPixelFormat f) {
        yuv_format_ = f;
    }

    void AvifEncodeParams::set_quality(double q) {
        quality_ = std::clamp(q, 0.0, 100.0);
    }

    void AvifEncodeParams::set_speed(int s) { speed_ = std::clamp(s, 0, 10); }

}  // namespace imgfetch


namespace imgfetch {

    std::expected<ImageBuffer, std::string> decode_avif(
        const uint8_t* data, size_t size
    ) {
        ::AvifDecoder decoder;
        if (!decoder.is_valid())
            return std::unexpected("avifDecoderCreate failed");

        auto res = decoder.set_io_memory(data, size);
        if (res != AVIF_RESULT_OK)
            return std::unexpected(avifResultToString(res));
        res = decoder.parse();
        if (res != AVIF_RESULT_OK)
            return std::unexpected(avifResultToString(res));
        res = decoder.next_image();
        if (res != AVIF_RESULT_OK)
            return std::unexpected(avifResultToString(res));

        const auto image = decoder.image();
        if (!image || image->width == 0 || image->height == 0)
            return std::unexpected("AVIF has no image");

        constexpr auto INT_LIMIT = static_cast<uint32_t>(
            std::numeric_limits<int>::max()
        );
        if (image->width > INT_LIMIT || image->height > INT_LIMIT ||
            !fits_pixel_limit(
                static_cast<int>(image->width), static_cast<int>(image->height)
            )) {
            return std::unexpected(std::format(
                "AVIF too large: {}x{}", image->width, image->height
            ));
        }

        ImageBuffer out;
        try {
            out.allocate(
                static_cast<int>(image->width),
                static_cast<int>(image->height),
                PixelFormat::rgba
            );
        } catch (const std::exception& e) {
            return std::unexpected(
                std::format("Failed to allocate AVIF pixels: {}", e.what())
            );
        }

        avifRGBImage rgb;
        avifRGBImageSetDefaults(&rgb, image);
        rgb.depth = 8;
        rgb.format = AVIF_RGB_FORMAT_RGBA;
        rgb.pixels = out.pixels.data();
        rgb.rowBytes = static_cast<uint32_t>(out.row_bytes());

        res = avifImageYUVToRGB(image, &rgb);
        if (res != AVIF_RESULT_OK) {
            return std::unexpected(
                std::format("YUV to RGB failed: {}", avifResultToString(res))
            );
        }

        return out;
    }

    std::expected<std::vector<uint8_t>, std::string> encode_avif(
        const ImageBuffer& img, const AvifEncodeParams& params
    ) {
        if (!img.is_valid())
            return std::unexpected("empty image");
        if (img.format != PixelFormat::rgb && img.format != PixelFormat::rgba) {
            return std::unexpected(std::format(
                "Unsupported pixel format for AVIF: {}", to_str(img.format)
            ));
        }

        ::AvifEncoder encoder;
        return encoder.encode(img, params);
    }

}  // namespace imgfetch
