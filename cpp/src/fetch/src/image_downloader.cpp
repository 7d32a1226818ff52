#include "imgfetch/fetch/image_downloader.hpp"

#include <exception>
#include <format>

#include "imgfetch/auxiliary/filesys.hpp"
#include "imgfetch/image/transform.hpp"


namespace {

    constexpr int HTTP_OK = 200;
    constexpr const char* DEAD_LINK_SENTINEL = "removed.png";


    imgfetch::DownloadResult make_failure(
        imgfetch::DownloadStatus status, std::string message
    ) {
        return imgfetch::DownloadResult{ status, std::move(message) };
    }

    // Turns anything thrown by a step (mostly std::bad_alloc on huge images)
    // into that step's error value
    template <typename TFunc>
    auto run_step(TFunc&& func) -> decltype(func()) {
        try {
            return func();
        } catch (const std::exception& e) {
            return std::unexpected(std::string(e.what()));
        }
    }

}  // namespace


namespace imgfetch {

    const char* to_str(DownloadStatus status) {
        switch (status) {
            case DownloadStatus::ok:
                return "ok";
            case DownloadStatus::transport_failure:
                return "transport_failure";
            case DownloadStatus::http_status_failure:
                return "http_status_failure";
            case DownloadStatus::dead_link_sentinel:
                return "dead_link_sentinel";
            case DownloadStatus::decode_failure:
                return "decode_failure";
            case DownloadStatus::filesystem_failure:
                return "filesystem_failure";
            case DownloadStatus::encode_failure:
                return "encode_failure";
        }
        return "unknown";
    }


    ImageDownloader::ImageDownloader(
        int target_size,
        std::shared_ptr<const IFetcher> fetcher,
        const EncodeOptions& encode_options
    )
        : fetcher_(std::move(fetcher))
        , encode_options_(encode_options)
        , target_size_(target_size) {}

    bool ImageDownloader::download(
        const std::string& url, const Path& save_to
    ) const {
        return this->download_ex(url, save_to).ok();
    }

    DownloadResult ImageDownloader::download_ex(
        const std::string& url, const Path& save_to
    ) const {
        using enum DownloadStatus;

        if (!fetcher_)
            return ::make_failure(transport_failure, "No fetcher configured");

        // ---- Fetch ----

        const auto response = ::run_step([&]() {
            return fetcher_->fetch(url);
        });
        if (!response)
            return ::make_failure(transport_failure, response.error());

        if (response->status_code != ::HTTP_OK) {
            return ::make_failure(
                http_status_failure,
                std::format("HTTP status {}", response->status_code)
            );
        }
        if (response->final_url.contains(::DEAD_LINK_SENTINEL)) {
            return ::make_failure(
                dead_link_sentinel, "Redirected to " + response->final_url
            );
        }

        // ---- Decode ----

        const auto& body = response->body;
        const auto decoded = ::run_step([&]() {
            return decode_image(
                reinterpret_cast<const uint8_t*>(body.data()), body.size()
            );
        });
        if (!decoded)
            return ::make_failure(decode_failure, decoded.error());

        auto image = ::run_step([&]() { return to_rgb(*decoded); });
        if (!image)
            return ::make_failure(decode_failure, image.error());

        // ---- Transform ----

        if (target_size_ > 0) {
            image = ::run_step([&]() {
                return resize_and_center_crop(*image, target_size_);
            });
            if (!image)
                return ::make_failure(decode_failure, image.error());
        }

        // ---- Save ----

        const auto dir_result = ::run_step([&]() {
            return ensure_parent_dir(save_to);
        });
        if (!dir_result)
            return ::make_failure(filesystem_failure, dir_result.error());

        const auto encoded = ::run_step([&]() {
            return encode_image(
                *image, format_from_ext(save_to), encode_options_
            );
        });
        if (!encoded) {
            return ::make_failure(
                encode_failure,
                std::format("{}: {}", tostr(save_to), encoded.error())
            );
        }

        const auto write_result = ::run_step([&]() {
            return write_file_atomic(save_to, *encoded);
        });
        if (!write_result)
            return ::make_failure(filesystem_failure, write_result.error());

        return DownloadResult{};
    }

}  // namespace imgfetch
