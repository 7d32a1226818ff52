#include <charconv>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include "imgfetch/auxiliary/fetcher_configs.hpp"
#include "imgfetch/fetch/annotations.hpp"
#include "imgfetch/fetch/batch.hpp"
#include "imgfetch/fetch/http_fetcher.hpp"
#include "imgfetch/fetch/image_downloader.hpp"


namespace {

    constexpr int EXIT_USAGE = 2;


    struct Args {
        // Single mode
        std::string url_;
        std::string save_to_;

        // Batch mode
        std::string annotations_;
        std::string save_dir_;
        bool update_annotations_ = false;

        std::string config_path_ = "imgfetch_configs.json";
        std::optional<int> target_size_;
        std::optional<int> workers_;

        bool is_batch() const { return !annotations_.empty(); }
    };


    void print_usage(const char* prog) {
        std::println(
            "Usage:\n"
            "  {0} <url> <save_to> [--size N] [--config path]\n"
            "  {0} --annotations <file.json> --save-to <dir> [--size N]\n"
            "      [--workers N] [--update-annotations] [--config path]\n"
            "\n"
            "  --size N    Resize shorter edge to N and center-crop to NxN.\n"
            "              Use -1 to save images without resizing.",
            prog
        );
    }

    std::optional<int> parse_int(std::string_view s) {
        int value = 0;
        const auto [ptr, ec] = std::from_chars(
            s.data(), s.data() + s.size(), value
        );
        if (ec != std::errc{} || ptr != s.data() + s.size())
            return std::nullopt;
        return value;
    }

    std::optional<Args> parse_args(int argc, char** argv) {
        Args a;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            const std::string_view k = argv[i];
            const bool has_value = i + 1 < argc;

            if (k == "--annotations" && has_value) {
                a.annotations_ = argv[++i];
            } else if (k == "--save-to" && has_value) {
                a.save_dir_ = argv[++i];
            } else if (k == "--config" && has_value) {
                a.config_path_ = argv[++i];
            } else if (k == "--size" && has_value) {
                a.target_size_ = ::parse_int(argv[++i]);
                if (!a.target_size_) {
                    std::println("Invalid --size: {}", argv[i]);
                    return std::nullopt;
                }
            } else if (k == "--workers" && has_value) {
                a.workers_ = ::parse_int(argv[++i]);
                if (!a.workers_ || *a.workers_ < 1) {
                    std::println("Invalid --workers: {}", argv[i]);
                    return std::nullopt;
                }
            } else if (k == "--update-annotations") {
                a.update_annotations_ = true;
            } else if (k.starts_with("--")) {
                std::println("Unknown arg: {}", k);
                return std::nullopt;
            } else {
                positional.emplace_back(k);
            }
        }

        if (a.is_batch()) {
            if (a.save_dir_.empty() || !positional.empty())
                return std::nullopt;
        } else {
            if (positional.size() != 2)
                return std::nullopt;
            a.url_ = positional[0];
            a.save_to_ = positional[1];
        }

        return a;
    }

    imgfetch::EncodeOptions make_encode_options(
        const imgfetch::FetcherConfigs& configs
    ) {
        imgfetch::EncodeOptions options;
        options.jpeg_quality = configs.jpeg_quality_;
        options.avif.set_quality(configs.avif_quality_);
        options.avif.set_speed(configs.avif_speed_);
        return options;
    }

    std::shared_ptr<const imgfetch::IFetcher> make_fetcher(
        const imgfetch::FetcherConfigs& configs
    ) {
        imgfetch::HttpFetcher::Options options;
        options.connection_timeout_sec_ = configs.connection_timeout_sec_;
        options.read_timeout_sec_ = configs.read_timeout_sec_;
        options.user_agent_ = configs.user_agent_;
        return std::make_shared<imgfetch::HttpFetcher>(options);
    }

    int run_single(const Args& args, const imgfetch::ImageDownloader& dl) {
        const auto save_to = imgfetch::fromstr(args.save_to_);
        const auto res = dl.download_ex(args.url_, save_to);
        if (!res.ok()) {
            std::println(
                "Download failed ({}): {}",
                imgfetch::to_str(res.status_),
                res.message_
            );
            return 1;
        }

        std::println("Saved: {}", imgfetch::tostr(save_to));
        return 0;
    }

    int run_batch(
        const Args& args, const imgfetch::ImageDownloader& dl, int workers
    ) {
        const auto ann_path = imgfetch::fromstr(args.annotations_);
        auto annotations = imgfetch::Annotations::load(ann_path);
        if (!annotations) {
            std::println("Cannot load annotations: {}", annotations.error());
            return 1;
        }

        const auto save_dir = imgfetch::fromstr(args.save_dir_);
        std::println(
            "Batch: {} images to {} with {} workers",
            annotations->size(),
            imgfetch::tostr(save_dir),
            workers
        );

        const auto summary = imgfetch::download_batch(
            dl, annotations->entries(), save_dir, workers
        );
        std::println(
            "Batch: {} total, {} downloaded, {} already present, {} failed",
            summary.total_,
            summary.succeeded_,
            summary.skipped_,
            summary.failed_
        );

        if (args.update_annotations_) {
            const auto removed = annotations->retain_if(
                [&save_dir](const imgfetch::AnnotationEntry& entry) {
                    std::error_code ec;
                    return imgfetch::fs::exists(
                        imgfetch::make_save_path(save_dir, entry), ec
                    );
                }
            );

            const auto saved = annotations->save(ann_path);
            if (!saved) {
                std::println("Cannot update annotations: {}", saved.error());
                return 1;
            }
            std::println(
                "Batch: removed {} annotations without images", removed
            );
        }

        return 0;
    }

}  // namespace


int main(int argc, char** argv) {
    const auto args = ::parse_args(argc, argv);
    if (!args) {
        ::print_usage(argv[0]);
        return ::EXIT_USAGE;
    }

    auto configs = imgfetch::load_or_create_configs(
        imgfetch::fromstr(args->config_path_)
    );
    if (!configs) {
        std::println("Cannot load configs: {}", configs.error());
        return 1;
    }

    if (args->target_size_)
        configs->target_size_ = *args->target_size_;
    if (args->workers_)
        configs->workers_ = *args->workers_;

    const imgfetch::ImageDownloader downloader{
        configs->target_size_,
        ::make_fetcher(*configs),
        ::make_encode_options(*configs),
    };

    if (args->is_batch())
        return ::run_batch(*args, downloader, configs->workers_);
    else
        return ::run_single(*args, downloader);
}
