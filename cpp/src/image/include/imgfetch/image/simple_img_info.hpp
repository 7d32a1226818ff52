#pragma once

#include <cstdint>
#include <optional>

#include "imgfetch/auxiliary/path.hpp"


namespace imgfetch {

    enum class ImageFormat {
        unknown,
        png,
        jpeg,
        avif,
    };

    const char* to_str(ImageFormat format);

    // Maps ".png", ".jpg", ".jpeg" and ".avif" (any case). Others are unknown.
    ImageFormat format_from_ext(const Path& path);


    struct SimpleImageInfo {
        bool is_png() const;
        bool is_jpeg() const;
        bool is_avif() const;

        ImageFormat format() const;

        const char* mime_type_ = "application/octet-stream";
        int64_t width_ = 0;
        int64_t height_ = 0;
    };

    // Reads only the header bytes. Returns nullopt for unrecognized content.
    std::optional<SimpleImageInfo> get_simple_img_info(
        const uint8_t* data, size_t size
    );

}  // namespace imgfetch
