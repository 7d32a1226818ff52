#include "imgfetch/image/simple_img_info.hpp"

#include <algorithm>
#include <cstring>
#include <string_view>

#include <sys/types.h>

#include <imageinfo.hpp>


namespace {

    struct MemoryBlock {
        const uint8_t* data_;
        size_t size_;
    };


    class MemoryReader {

    public:
        explicit MemoryReader(const MemoryBlock& block) : block_(block) {}

        size_t size() { return block_.size_; }

        void read(void* buf, off_t offset, size_t size) {
            auto* out = static_cast<uint8_t*>(buf);
            const auto begin = static_cast<size_t>(offset);

            size_t avail = 0;
            if (begin < block_.size_)
                avail = std::min(size, block_.size_ - begin);

            if (avail > 0)
                std::memcpy(out, block_.data_ + begin, avail);
            if (avail < size)
                std::memset(out + avail, 0, size - avail);
        }

    private:
        MemoryBlock block_;
    };

}  // namespace


namespace imgfetch {

    const char* to_str(ImageFormat format) {
        switch (format) {
            case ImageFormat::png:
                return "png";
            case ImageFormat::jpeg:
                return "jpeg";
            case ImageFormat::avif:
                return "avif";
            case ImageFormat::unknown:
                break;
        }
        return "unknown";
    }

    ImageFormat format_from_ext(const Path& path) {
        const auto ext = lower_ext(path);
        if (ext == ".png")
            return ImageFormat::png;
        if (ext == ".jpg" || ext == ".jpeg")
            return ImageFormat::jpeg;
        if (ext == ".avif")
            return ImageFormat::avif;
        return ImageFormat::unknown;
    }


    bool SimpleImageInfo::is_png() const {
        return mime_type_ == std::string_view("image/png");
    }

    bool SimpleImageInfo::is_jpeg() const {
        return mime_type_ == std::string_view("image/jpeg");
    }

    bool SimpleImageInfo::is_avif() const {
        return mime_type_ == std::string_view("image/avif");
    }

    ImageFormat SimpleImageInfo::format() const {
        if (this->is_png())
            return ImageFormat::png;
        if (this->is_jpeg())
            return ImageFormat::jpeg;
        if (this->is_avif())
            return ImageFormat::avif;
        return ImageFormat::unknown;
    }


    std::optional<SimpleImageInfo> get_simple_img_info(
        const uint8_t* data, size_t size
    ) {
        if (!data || size == 0)
            return std::nullopt;

        const auto info = imageinfo::parse<::MemoryReader>(
            ::MemoryBlock{ data, size }
        );
        if (!info.ok())
            return std::nullopt;

        SimpleImageInfo result;
        result.mime_type_ = info.mimetype();
        result.width_ = info.size().width;
        result.height_ = info.size().height;
        return result;
    }

}  // namespace imgfetch
