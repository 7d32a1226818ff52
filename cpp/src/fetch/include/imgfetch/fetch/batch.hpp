#pragma once

#include <vector>

#include "imgfetch/fetch/annotations.hpp"
#include "imgfetch/fetch/image_downloader.hpp"


namespace imgfetch {

    struct BatchSummary {
        size_t total_ = 0;
        // Destination already existed, nothing fetched
        size_t skipped_ = 0;
        size_t succeeded_ = 0;
        size_t failed_ = 0;
    };


    // At most `workers` downloads in flight. Existing files are left alone.
    BatchSummary download_batch(
        const ImageDownloader& downloader,
        const std::vector<AnnotationEntry>& entries,
        const Path& save_dir,
        int workers
    );

}  // namespace imgfetch
