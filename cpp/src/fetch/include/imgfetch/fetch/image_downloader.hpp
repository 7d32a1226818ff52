#pragma once

#include <memory>
#include <string>

#include "imgfetch/auxiliary/path.hpp"
#include "imgfetch/fetch/fetcher.hpp"
#include "imgfetch/image/codec.hpp"


namespace imgfetch {

    enum class DownloadStatus {
        ok,
        transport_failure,
        http_status_failure,
        dead_link_sentinel,
        decode_failure,
        filesystem_failure,
        encode_failure,
    };

    const char* to_str(DownloadStatus status);


    struct DownloadResult {
        bool ok() const { return status_ == DownloadStatus::ok; }

        DownloadStatus status_ = DownloadStatus::ok;
        std::string message_;
    };


    // Downloads an image, normalizes it to RGB and saves it. A positive
    // `target_size` resizes the shorter edge to it and center-crops the
    // longer one. The output format follows the destination extension.
    //
    // Imgur answers missing images with 200 and a redirect to "removed.png".
    class ImageDownloader {

    public:
        ImageDownloader(
            int target_size,
            std::shared_ptr<const IFetcher> fetcher,
            const EncodeOptions& encode_options = {}
        );

        // True only if the image was saved to `save_to`
        bool download(const std::string& url, const Path& save_to) const;

        DownloadResult download_ex(
            const std::string& url, const Path& save_to
        ) const;

        int target_size() const { return target_size_; }

    private:
        std::shared_ptr<const IFetcher> fetcher_;
        EncodeOptions encode_options_;
        const int target_size_;
    };

}  // namespace imgfetch
