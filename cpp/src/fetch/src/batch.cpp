#include "imgfetch/fetch/batch.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <print>

#include <tbb/task_arena.h>
#include <tbb/task_group.h>


namespace imgfetch {

    BatchSummary download_batch(
        const ImageDownloader& downloader,
        const std::vector<AnnotationEntry>& entries,
        const Path& save_dir,
        int workers
    ) {
        std::atomic<size_t> skipped = 0;
        std::atomic<size_t> succeeded = 0;
        std::atomic<size_t> failed = 0;

        tbb::task_arena arena{ std::max(workers, 1) };
        tbb::task_group tg;

        arena.execute([&]() {
            for (const auto& entry : entries) {
                tg.run([&, p_entry = &entry]() {
                    const auto& entry = *p_entry;

                    // A task that throws would cancel the whole group
                    try {
                        const auto save_to = make_save_path(save_dir, entry);

                        std::error_code ec;
                        if (fs::exists(save_to, ec)) {
                            ++skipped;
                            return;
                        }

                        const auto res = downloader.download_ex(
                            entry.url_, save_to
                        );
                        if (res.ok()) {
                            ++succeeded;
                            return;
                        }

                        ++failed;
                        std::println(
                            "Batch: {} failed ({}): {}",
                            entry.url_,
                            to_str(res.status_),
                            res.message_
                        );
                    } catch (const std::exception& e) {
                        ++failed;
                        std::println(
                            "Batch: {} failed: {}", entry.url_, e.what()
                        );
                    }
                });
            }

            tg.wait();
        });

        BatchSummary summary;
        summary.total_ = entries.size();
        summary.skipped_ = skipped;
        summary.succeeded_ = succeeded;
        summary.failed_ = failed;
        return summary;
    }

}  // namespace imgfetch
