#include "imgfetch/image/transform.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>
#include <limits>
#include <optional>
#include <vector>


namespace {

    struct ResampleCoeffs {
        const double* weights(int i) const {
            return weights_.data() + static_cast<size_t>(i) * kernel_size_;
        }

        std::vector<int> first_;
        std::vector<int> count_;
        std::vector<double> weights_;
        int kernel_size_ = 0;
    };


    double triangle_filter(double x) {
        x = std::abs(x);
        return x < 1.0 ? 1.0 - x : 0.0;
    }

    uint8_t clamp_u8(double v) {
        return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
    }

    ResampleCoeffs calc_coeffs(int in_size, int out_size) {
        const double scale = static_cast<double>(in_size) / out_size;
        const double filter_scale = std::max(scale, 1.0);
        // Triangle filter has a support of 1 at unit scale
        const double support = filter_scale;

        ResampleCoeffs c;
        c.kernel_size_ = static_cast<int>(std::ceil(support)) * 2 + 1;
        c.first_.resize(static_cast<size_t>(out_size));
        c.count_.resize(static_cast<size_t>(out_size));
        c.weights_.assign(static_cast<size_t>(out_size) * c.kernel_size_, 0.0);

        for (int i = 0; i < out_size; ++i) {
            const double center = (i + 0.5) * scale;
            const int first = std::max(
                static_cast<int>(center - support + 0.5), 0
            );
            const int last = std::min(
                static_cast<int>(center + support + 0.5), in_size
            );
            const int count = std::min(last - first, c.kernel_size_);

            auto w = c.weights_.data() +
                     static_cast<size_t>(i) * c.kernel_size_;
            double total = 0;
            for (int k = 0; k < count; ++k) {
                w[k] = ::triangle_filter(
                    (first + k - center + 0.5) / filter_scale
                );
                total += w[k];
            }
            if (total > 0) {
                for (int k = 0; k < count; ++k) w[k] /= total;
            }

            c.first_[i] = first;
            c.count_[i] = count;
        }

        return c;
    }

    std::optional<int> round_edge(double v) {
        // nearbyint follows the default FE_TONEAREST mode: half to even
        const double rounded = std::nearbyint(v);
        if (!(rounded >= 1.0) ||
            rounded > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(rounded);
    }

    imgfetch::ImageBuffer resample_horizontal(
        const imgfetch::ImageBuffer& src, int dst_width
    ) {
        imgfetch::ImageBuffer out;
        out.allocate(dst_width, src.height, src.format);
        out.cmyk_inverted = src.cmyk_inverted;

        const auto coeffs = ::calc_coeffs(src.width, dst_width);
        const int ch = src.channels();

        for (int y = 0; y < src.height; ++y) {
            const uint8_t* in_row = src.row(y);
            uint8_t* out_row = out.row(y);

            for (int x = 0; x < dst_width; ++x) {
                const auto w = coeffs.weights(x);
                const int first = coeffs.first_[x];
                const int count = coeffs.count_[x];

                for (int c = 0; c < ch; ++c) {
                    double acc = 0;
                    for (int k = 0; k < count; ++k)
                        acc += w[k] * in_row[(first + k) * ch + c];
                    out_row[x * ch + c] = ::clamp_u8(acc);
                }
            }
        }

        return out;
    }

    imgfetch::ImageBuffer resample_vertical(
        const imgfetch::ImageBuffer& src, int dst_height
    ) {
        imgfetch::ImageBuffer out;
        out.allocate(src.width, dst_height, src.format);
        out.cmyk_inverted = src.cmyk_inverted;

        const auto coeffs = ::calc_coeffs(src.height, dst_height);
        const size_t row_bytes = src.row_bytes();

        for (int y = 0; y < dst_height; ++y) {
            const auto w = coeffs.weights(y);
            const int first = coeffs.first_[y];
            const int count = coeffs.count_[y];
            uint8_t* out_row = out.row(y);

            for (size_t i = 0; i < row_bytes; ++i) {
                double acc = 0;
                for (int k = 0; k < count; ++k)
                    acc += w[k] * src.row(first + k)[i];
                out_row[i] = ::clamp_u8(acc);
            }
        }

        return out;
    }

}  // namespace


namespace imgfetch {

    std::optional<CropGeometry> calc_crop_geometry(
        int width, int height, int target_size
    ) {
        if (target_size <= 0 || width <= 0 || height <= 0)
            return std::nullopt;

        const double scale = static_cast<double>(target_size) /
                             static_cast<double>(std::min(width, height));

        const auto resized_width = ::round_edge(width * scale);
        const auto resized_height = ::round_edge(height * scale);
        if (!resized_width || !resized_height)
            return std::nullopt;

        CropGeometry geom;
        geom.resized_width = *resized_width;
        geom.resized_height = *resized_height;

        if (geom.resized_width >= geom.resized_height) {
            geom.box.left = (geom.resized_width - target_size) / 2;
            geom.box.top = 0;
            geom.box.right = geom.box.left + target_size;
            geom.box.bottom = target_size;
        } else {
            geom.box.left = 0;
            geom.box.top = (geom.resized_height - target_size) / 2;
            geom.box.right = target_size;
            geom.box.bottom = geom.box.top + target_size;
        }

        return geom;
    }

    std::expected<ImageBuffer, std::string> resize_bilinear(
        const ImageBuffer& src, int dst_width, int dst_height
    ) {
        if (!src.is_valid())
            return std::unexpected("Invalid image for resize");
        if (dst_width <= 0 || dst_height <= 0) {
            return std::unexpected(std::format(
                "Invalid resize target {}x{}", dst_width, dst_height
            ));
        }

        if (dst_width == src.width && dst_height == src.height)
            return src;

        // Horizontal pass runs first, so its output is the intermediate
        if (!fits_pixel_limit(dst_width, dst_height) ||
            !fits_pixel_limit(dst_width, src.height)) {
            return std::unexpected(std::format(
                "Resize target {}x{} exceeds the pixel limit",
                dst_width,
                dst_height
            ));
        }

        if (dst_width == src.width)
            return ::resample_vertical(src, dst_height);
        if (dst_height == src.height)
            return ::resample_horizontal(src, dst_width);

        const auto tmp = ::resample_horizontal(src, dst_width);
        return ::resample_vertical(tmp, dst_height);
    }

    std::expected<ImageBuffer, std::string> crop(
        const ImageBuffer& src, const CropBox& box
    ) {
        if (!src.is_valid())
            return std::unexpected("Invalid image for crop");

        if (box.left < 0 || box.top < 0 || box.right > src.width ||
            box.bottom > src.height || box.width() <= 0 || box.height() <= 0) {
            return std::unexpected(std::format(
                "Crop box [{}, {}, {}, {}] out of bounds for {}x{}",
                box.left,
                box.top,
                box.right,
                box.bottom,
                src.width,
                src.height
            ));
        }

        ImageBuffer out;
        out.allocate(box.width(), box.height(), src.format);
        out.cmyk_inverted = src.cmyk_inverted;

        const size_t offset = static_cast<size_t>(box.left) * src.channels();
        for (int y = 0; y < out.height; ++y) {
            std::memcpy(
                out.row(y), src.row(box.top + y) + offset, out.row_bytes()
            );
        }

        return out;
    }

    std::expected<ImageBuffer, std::string> resize_and_center_crop(
        const ImageBuffer& src, int target_size
    ) {
        const auto geom = calc_crop_geometry(
            src.width, src.height, target_size
        );
        if (!geom) {
            return std::unexpected(std::format(
                "Cannot crop {}x{} to {}", src.width, src.height, target_size
            ));
        }

        const auto resized = resize_bilinear(
            src, geom->resized_width, geom->resized_height
        );
        if (!resized)
            return std::unexpected(resized.error());

        return crop(*resized, geom->box);
    }

}  // namespace imgfetch
