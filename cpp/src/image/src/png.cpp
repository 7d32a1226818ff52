#include "imgfetch/image/png.hpp"

#include <cstring>
#include <format>
#include <stdexcept>

#include <png.h>

#include "imgfetch/auxiliary/err_str.hpp"


namespace {

    struct PngMemStream {
        const uint8_t* data_ = nullptr;
        size_t size_ = 0;
        size_t offset_ = 0;
    };


    void png_mem_read(png_structp png_ptr, png_bytep out, png_size_t size) {
        auto* io = static_cast<::PngMemStream*>(png_get_io_ptr(png_ptr));

        if (!io || !io->data_ || io->offset_ + size > io->size_) {
            png_error(png_ptr, "Read error");
        }

        std::memcpy(out, io->data_ + io->offset_, size);
        io->offset_ += size;
    }

    void png_mem_write(png_structp png_ptr, png_bytep data, png_size_t size) {
        auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png_ptr));
        if (!out)
            png_error(png_ptr, "Write error");

        out->insert(out->end(), data, data + size);
    }

    void png_mem_flush(png_structp) {}

    void png_throw_error(png_structp png_ptr, png_const_charp msg) {
        throw std::runtime_error(msg ? msg : "libpng error");
    }

    void png_quiet_warning(png_structp png_ptr, png_const_charp msg) {}


    imgfetch::PixelFormat channels_to_format(int channels) {
        switch (channels) {
            case 1:
                return imgfetch::PixelFormat::gray;
            case 2:
                return imgfetch::PixelFormat::gray_alpha;
            case 4:
                return imgfetch::PixelFormat::rgba;
            default:
                return imgfetch::PixelFormat::rgb;
        }
    }


    class PngReader {

    public:
        PngReader() = default;

        ~PngReader() { this->destroy(); }

        imgfetch::ErrStr open(const uint8_t* data, size_t size) {
            this->destroy();

            // ---- Verify signature ----

            if (!data || size < 8)
                return std::unexpected("Short read (signature)");
            if (png_sig_cmp(data, 0, 8))
                return std::unexpected("Not a PNG file");

            // ---- Init libpng ----

            png_ptr_ = png_create_read_struct(
                PNG_LIBPNG_VER_STRING,
                nullptr,
                png_throw_error,
                png_quiet_warning
            );
            if (!png_ptr_)
                return std::unexpected("png_create_read_struct failed");

            info_ptr_ = png_create_info_struct(png_ptr_);
            if (!info_ptr_)
                return std::unexpected("png_create_info_struct failed");

            // Hook memory block into libpng, signature already consumed
            io_.data_ = data;
            io_.size_ = size;
            io_.offset_ = 8;
            png_set_read_fn(png_ptr_, &io_, png_mem_read);
            png_set_sig_bytes(png_ptr_, 8);

            return {};
        }

        imgfetch::ErrStr parse_info() {
            try {
                png_read_info(png_ptr_, info_ptr_);
            } catch (const std::exception& e) {
                return std::unexpected(
                    std::format("Failed to parse PNG info: {}", e.what())
                );
            }

            return {};
        }

        imgfetch::ErrStr parse_pixels(imgfetch::ImageBuffer& out) {
            try {
                const auto bit_depth = png_get_bit_depth(png_ptr_, info_ptr_);
                const auto color_type = png_get_color_type(
                    png_ptr_, info_ptr_
                );

                // ---- normalize to 8-bit
                // 16-bit -> 8-bit
                if (bit_depth == 16)
                    png_set_strip_16(png_ptr_);

                // Palette -> RGB
                if (color_type == PNG_COLOR_TYPE_PALETTE)
                    png_set_palette_to_rgb(png_ptr_);

                // Grayscale < 8-bit -> 8-bit
                if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8)
                    png_set_expand_gray_1_2_4_to_8(png_ptr_);

                // tRNS chunk -> alpha channel
                if (png_get_valid(png_ptr_, info_ptr_, PNG_INFO_tRNS))
                    png_set_tRNS_to_alpha(png_ptr_);

                png_set_interlace_handling(png_ptr_);

                // Update info after transforms
                png_read_update_info(png_ptr_, info_ptr_);

                const auto width = png_get_image_width(png_ptr_, info_ptr_);
                const auto height = png_get_image_height(png_ptr_, info_ptr_);
                const int channels = png_get_channels(png_ptr_, info_ptr_);

                out.allocate(
                    static_cast<int>(width),
                    static_cast<int>(height),
                    ::channels_to_format(channels)
                );

                const png_size_t rowbytes = png_get_rowbytes(
                    png_ptr_, info_ptr_
                );
                if (rowbytes != out.row_bytes()) {
                    return std::unexpected(
                        "Unexpected row size after conversion (expected 8-bit)"
                    );
                }

                // Row pointers for libpng
                std::vector<png_bytep> rows(height);
                for (png_uint_32 y = 0; y < height; ++y) {
                    rows[y] = reinterpret_cast<png_bytep>(
                        out.row(static_cast<int>(y))
                    );
                }

                png_read_image(png_ptr_, rows.data());
                png_read_end(png_ptr_, nullptr);
            } catch (const std::exception& e) {
                return std::unexpected(
                    std::format("Failed to read PNG pixels: {}", e.what())
                );
            }

            return {};
        }

        void destroy() {
            if (png_ptr_ || info_ptr_) {
                png_destroy_read_struct(&png_ptr_, &info_ptr_, nullptr);
                png_ptr_ = nullptr;
                info_ptr_ = nullptr;
            }
            io_ = PngMemStream{};
        }

    private:
        PngMemStream io_;
        png_structp png_ptr_ = nullptr;
        png_infop info_ptr_ = nullptr;
    };


    class PngWriter {

    public:
        PngWriter() = default;

        ~PngWriter() {
            if (png_ptr_ || info_ptr_)
                png_destroy_write_struct(&png_ptr_, &info_ptr_);
        }

        imgfetch::ErrStr write(
            const imgfetch::ImageBuffer& img, std::vector<uint8_t>& out
        ) {
            int color_type = 0;
            switch (img.format) {
                case imgfetch::PixelFormat::gray:
                    color_type = PNG_COLOR_TYPE_GRAY;
                    break;
                case imgfetch::PixelFormat::gray_alpha:
                    color_type = PNG_COLOR_TYPE_GRAY_ALPHA;
                    break;
                case imgfetch::PixelFormat::rgb:
                    color_type = PNG_COLOR_TYPE_RGB;
                    break;
                case imgfetch::PixelFormat::rgba:
                    color_type = PNG_COLOR_TYPE_RGBA;
                    break;
                default:
                    return std::unexpected(std::format(
                        "Unsupported pixel format for PNG: {}",
                        imgfetch::to_str(img.format)
                    ));
            }

            png_ptr_ = png_create_write_struct(
                PNG_LIBPNG_VER_STRING,
                nullptr,
                png_throw_error,
                png_quiet_warning
            );
            if (!png_ptr_)
                return std::unexpected("png_create_write_struct failed");

            info_ptr_ = png_create_info_struct(png_ptr_);
            if (!info_ptr_)
                return std::unexpected("png_create_info_struct failed");

            try {
                out.clear();
                png_set_write_fn(png_ptr_, &out, png_mem_write, png_mem_flush);

                png_set_IHDR(
                    png_ptr_,
                    info_ptr_,
                    static_cast<png_uint_32>(img.width),
                    static_cast<png_uint_32>(img.height),
                    8,
                    color_type,
                    PNG_INTERLACE_NONE,
                    PNG_COMPRESSION_TYPE_BASE,
                    PNG_FILTER_TYPE_BASE
                );
                png_write_info(png_ptr_, info_ptr_);

                std::vector<png_bytep> rows(static_cast<size_t>(img.height));
                for (int y = 0; y < img.height; ++y) {
                    rows[static_cast<size_t>(y)] = const_cast<png_bytep>(
                        img.row(y)
                    );
                }

                png_write_image(png_ptr_, rows.data());
                png_write_end(png_ptr_, info_ptr_);
            } catch (const std::exception& e) {
                return std::unexpected(
                    std::format("Failed to encode PNG: {}", e.what())
                );
            }

            return {};
        }

    private:
        png_structp png_ptr_ = nullptr;
        png_infop info_ptr_ = nullptr;
    };

}  // namespace


namespace imgfetch {

    std::expected<ImageBuffer, std::string> decode_png(
        const uint8_t* data, size_t size
    ) {
        ::PngReader reader;

        const auto exp_open = reader.open(data, size);
        if (!exp_open)
            return std::unexpected(exp_open.error());

        // ---- Parse header ----

        const auto exp_parse_info = reader.parse_info();
        if (!exp_parse_info)
            return std::unexpected(exp_parse_info.error());

        ImageBuffer img;
        const auto exp_parse_pixels = reader.parse_pixels(img);
        if (!exp_parse_pixels)
            return std::unexpected(exp_parse_pixels.error());

        return img;
    }

    std::expected<std::vector<uint8_t>, std::string> encode_png(
        const ImageBuffer& img
    ) {
        if (!img.is_valid())
            return std::unexpected("Invalid image for PNG encode");

        std::vector<uint8_t> out;
        ::PngWriter writer;

        const auto exp_write = writer.write(img, out);
        if (!exp_write)
            return std::unexpected(exp_write.error());

        return out;
    }

}  // namespace imgfetch
