#include "imgfetch/image/jpeg.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <format>
#include <stdexcept>

// jpeglib.h needs size_t and FILE declared beforehand
#include <jpeglib.h>
#include <jerror.h>


namespace {

    [[noreturn]] void jpeg_throw_error(j_common_ptr cinfo) {
        char msg[JMSG_LENGTH_MAX]{};
        (*cinfo->err->format_message)(cinfo, msg);
        throw std::runtime_error(msg);
    }

    // Warnings are ignored, except running out of data. libjpeg would pad
    // the missing rows with gray and report success.
    void jpeg_filter_message(j_common_ptr cinfo, int msg_level) {
        if (msg_level != -1)
            return;

        if (cinfo->err->msg_code == JWRN_JPEG_EOF)
            jpeg_throw_error(cinfo);
        ++cinfo->err->num_warnings;
    }

    bool is_jpeg_data(const uint8_t* data, size_t size) {
        return size >= 2 && data[0] == 0xFF && data[1] == 0xD8;
    }

    bool has_adobe_marker(const jpeg_decompress_struct& cinfo) {
        for (auto m = cinfo.marker_list; m != nullptr; m = m->next) {
            if (m->marker != (JPEG_APP0 + 14))
                continue;
            if (m->data_length < 12)
                continue;
            if (std::memcmp(m->data, "Adobe", 5) == 0)
                return true;
        }
        return false;
    }


    class JpegDecompressor {

    public:
        JpegDecompressor() {
            cinfo_.err = jpeg_std_error(&jerr_);
            jerr_.error_exit = jpeg_throw_error;
            jerr_.emit_message = jpeg_filter_message;
            jpeg_create_decompress(&cinfo_);
        }

        ~JpegDecompressor() { jpeg_destroy_decompress(&cinfo_); }

        JpegDecompressor(const JpegDecompressor&) = delete;
        JpegDecompressor& operator=(const JpegDecompressor&) = delete;

        void decode(
            const uint8_t* data, size_t size, imgfetch::ImageBuffer& out
        ) {
            jpeg_mem_src(
                &cinfo_,
                const_cast<unsigned char*>(data),
                static_cast<unsigned long>(size)
            );

            // Adobe marker indicates inverted CMYK
            jpeg_save_markers(&cinfo_, JPEG_APP0 + 14, 0xFFFF);

            jpeg_read_header(&cinfo_, TRUE);

            imgfetch::PixelFormat format = imgfetch::PixelFormat::rgb;
            const J_COLOR_SPACE cs = cinfo_.jpeg_color_space;
            if (cs == JCS_GRAYSCALE) {
                cinfo_.out_color_space = JCS_GRAYSCALE;
                format = imgfetch::PixelFormat::gray;
            } else if (cs == JCS_CMYK || cs == JCS_YCCK) {
                cinfo_.out_color_space = JCS_CMYK;
                format = imgfetch::PixelFormat::cmyk;
            } else {
                cinfo_.out_color_space = JCS_RGB;
            }

            jpeg_start_decompress(&cinfo_);

            out.allocate(
                static_cast<int>(cinfo_.output_width),
                static_cast<int>(cinfo_.output_height),
                format
            );
            out.cmyk_inverted = format == imgfetch::PixelFormat::cmyk &&
                                ::has_adobe_marker(cinfo_);

            if (static_cast<int>(cinfo_.output_components) != out.channels())
                throw std::runtime_error("Unexpected JPEG component count");

            while (cinfo_.output_scanline < cinfo_.output_height) {
                JSAMPROW rowptr[1];
                rowptr[0] = out.row(static_cast<int>(cinfo_.output_scanline));
                jpeg_read_scanlines(&cinfo_, rowptr, 1);
            }

            jpeg_finish_decompress(&cinfo_);
        }

    private:
        jpeg_decompress_struct cinfo_{};
        jpeg_error_mgr jerr_{};
    };


    class JpegCompressor {

    public:
        JpegCompressor() {
            cinfo_.err = jpeg_std_error(&jerr_);
            jerr_.error_exit = jpeg_throw_error;
            jerr_.emit_message = jpeg_filter_message;
            jpeg_create_compress(&cinfo_);
        }

        ~JpegCompressor() {
            jpeg_destroy_compress(&cinfo_);
            if (buffer_)
                std::free(buffer_);
        }

        JpegCompressor(const JpegCompressor&) = delete;
        JpegCompressor& operator=(const JpegCompressor&) = delete;

        void encode(
            const imgfetch::ImageBuffer& img,
            int quality,
            std::vector<uint8_t>& out
        ) {
            jpeg_mem_dest(&cinfo_, &buffer_, &buffer_size_);

            cinfo_.image_width = static_cast<JDIMENSION>(img.width);
            cinfo_.image_height = static_cast<JDIMENSION>(img.height);
            if (img.format == imgfetch::PixelFormat::gray) {
                cinfo_.input_components = 1;
                cinfo_.in_color_space = JCS_GRAYSCALE;
            } else {
                cinfo_.input_components = 3;
                cinfo_.in_color_space = JCS_RGB;
            }

            jpeg_set_defaults(&cinfo_);
            jpeg_set_quality(&cinfo_, quality, TRUE);
            jpeg_start_compress(&cinfo_, TRUE);

            while (cinfo_.next_scanline < cinfo_.image_height) {
                JSAMPROW rowptr[1];
                rowptr[0] = const_cast<JSAMPROW>(
                    img.row(static_cast<int>(cinfo_.next_scanline))
                );
                jpeg_write_scanlines(&cinfo_, rowptr, 1);
            }

            jpeg_finish_compress(&cinfo_);
            out.assign(buffer_, buffer_ + buffer_size_);
        }

    private:
        jpeg_compress_struct cinfo_{};
        jpeg_error_mgr jerr_{};
        unsigned char* buffer_ = nullptr;
        unsigned long buffer_size_ = 0;
    };

}  // namespace


namespace imgfetch {

    std::expected<ImageBuffer, std::string> decode_jpeg(
        const uint8_t* data, size_t size
    ) {
        if (!data || !::is_jpeg_data(data, size))
            return std::unexpected("Not a JPEG image");

        ImageBuffer img;
        try {
            ::JpegDecompressor decompressor;
            decompressor.decode(data, size, img);
        } catch (const std::exception& e) {
            return std::unexpected(
                std::format("Failed to decode JPEG: {}", e.what())
            );
        }

        return img;
    }

    std::expected<std::vector<uint8_t>, std::string> encode_jpeg(
        const ImageBuffer& img, int quality
    ) {
        if (!img.is_valid())
            return std::unexpected("Invalid image for JPEG encode");
        if (img.format != PixelFormat::gray && img.format != PixelFormat::rgb) {
            return std::unexpected(std::format(
                "Unsupported pixel format for JPEG: {}", to_str(img.format)
            ));
        }

        std::vector<uint8_t> out;
        try {
            ::JpegCompressor compressor;
            compressor.encode(img, std::clamp(quality, 1, 100), out);
        } catch (const std::exception& e) {
            return std::unexpected(
                std::format("Failed to encode JPEG: {}", e.what())
            );
        }

        return out;
    }

}  // namespace imgfetch
