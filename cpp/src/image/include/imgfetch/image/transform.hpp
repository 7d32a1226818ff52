#pragma once

#include <expected>
#include <optional>
#include <string>

#include "imgfetch/image/img_buffer.hpp"


namespace imgfetch {

    // Half-open box: [left, right) x [top, bottom)
    struct CropBox {
        int width() const { return right - left; }
        int height() const { return bottom - top; }

        int left = 0;
        int top = 0;
        int right = 0;
        int bottom = 0;
    };


    struct CropGeometry {
        int resized_width = 0;
        int resized_height = 0;
        CropBox box;
    };


    // Resize the shorter edge to `target_size`, then center-crop the longer
    // edge to it. Resized edges round half-to-even and the margin before the
    // box is floor((resized - target_size) / 2).
    //
    // nullopt if `target_size` <= 0, the source is empty, or a resized edge
    // does not fit in an int.
    std::optional<CropGeometry> calc_crop_geometry(
        int width, int height, int target_size
    );

    // Separable triangle filter, widened on downscale
    std::expected<ImageBuffer, std::string> resize_bilinear(
        const ImageBuffer& src, int dst_width, int dst_height
    );

    std::expected<ImageBuffer, std::string> crop(
        const ImageBuffer& src, const CropBox& box
    );

    // Result is exactly target_size x target_size
    std::expected<ImageBuffer, std::string> resize_and_center_crop(
        const ImageBuffer& src, int target_size
    );

}  // namespace imgfetch
