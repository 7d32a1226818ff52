#include <map>
#include <memory>
#include <optional>
#include <stdexcept>

#include "checker.hpp"
#include "imgfetch/auxiliary/filesys.hpp"
#include "imgfetch/fetch/batch.hpp"
#include "imgfetch/fetch/image_downloader.hpp"
#include "imgfetch/image/jpeg.hpp"
#include "imgfetch/image/png.hpp"


namespace {

    // Serves canned responses, anything else is a transport failure
    class FakeFetcher : public imgfetch::IFetcher {

    public:
        void add(const std::string& url, imgfetch::FetchResult res) {
            responses_[url] = std::move(res);
        }

        void add_ok(const std::string& url, const std::vector<uint8_t>& body) {
            imgfetch::FetchResult res;
            res.status_code = 200;
            res.final_url = url;
            res.body.assign(body.begin(), body.end());
            this->add(url, std::move(res));
        }

        std::expected<imgfetch::FetchResult, std::string> fetch(
            const std::string& url
        ) const override {
            const auto it = responses_.find(url);
            if (it == responses_.end())
                return std::unexpected("Connection refused: " + url);
            return it->second;
        }

    private:
        std::map<std::string, imgfetch::FetchResult> responses_;
    };


    imgfetch::ImageBuffer make_rgb(int w, int h) {
        imgfetch::ImageBuffer img;
        img.allocate(w, h, imgfetch::PixelFormat::rgb);
        for (int y = 0; y < h; ++y) {
            auto row = img.row(y);
            for (int x = 0; x < w; ++x) {
                row[x * 3 + 0] = static_cast<uint8_t>(x % 256);
                row[x * 3 + 1] = static_cast<uint8_t>(y % 256);
                row[x * 3 + 2] = 128;
            }
        }
        return img;
    }

    std::vector<uint8_t> make_png_bytes(
        int w, int h, imgfetch::PixelFormat f = imgfetch::PixelFormat::rgb
    ) {
        imgfetch::ImageBuffer img;
        img.allocate(w, h, f);
        for (size_t i = 0; i < img.pixels.size(); ++i)
            img.pixels[i] = static_cast<uint8_t>(i % 199);
        return imgfetch::encode_png(img).value();
    }

    std::optional<imgfetch::ImageBuffer> load_image(const imgfetch::Path& p) {
        const auto bytes = imgfetch::read_file(p);
        if (bytes.empty())
            return std::nullopt;
        auto img = imgfetch::decode_image(bytes.data(), bytes.size());
        if (!img)
            return std::nullopt;
        return std::move(*img);
    }

    bool exists(const imgfetch::Path& p) {
        std::error_code ec;
        return imgfetch::fs::exists(p, ec);
    }


    constexpr const char* URL_LANDSCAPE = "https://i.redd.it/landscape.jpg";
    constexpr const char* URL_PORTRAIT = "https://i.redd.it/portrait.png";
    constexpr const char* URL_RGBA = "https://i.redd.it/alpha.png";
    constexpr const char* URL_GRAY = "https://i.redd.it/gray.png";
    constexpr const char* URL_404 = "https://i.redd.it/gone.jpg";
    constexpr const char* URL_REMOVED = "https://i.imgur.com/abcdef.jpg";
    constexpr const char* URL_HTML = "https://i.redd.it/page.jpg";
    constexpr const char* URL_OFFLINE = "https://offline.example/x.jpg";
    constexpr const char* URL_CUT_JPEG = "https://i.redd.it/cut.jpg";
    constexpr const char* URL_CUT_PNG = "https://i.redd.it/cut.png";
    constexpr const char* URL_SLIVER = "https://i.redd.it/sliver.png";


    class ThrowingFetcher : public imgfetch::IFetcher {

    public:
        std::expected<imgfetch::FetchResult, std::string> fetch(
            const std::string& url
        ) const override {
            throw std::runtime_error("fetcher blew up on " + url);
        }
    };


    std::shared_ptr<FakeFetcher> make_fetcher() {
        auto fetcher = std::make_shared<FakeFetcher>();

        const auto jpeg = imgfetch::encode_jpeg(::make_rgb(800, 600), 90);
        fetcher->add_ok(URL_LANDSCAPE, jpeg.value());
        const auto png = ::make_png_bytes(400, 600);
        fetcher->add_ok(URL_PORTRAIT, png);

        // Connection dropped mid-body
        fetcher->add_ok(
            URL_CUT_JPEG,
            std::vector<uint8_t>(
                jpeg->begin(), jpeg->begin() + jpeg->size() / 4
            )
        );
        fetcher->add_ok(
            URL_CUT_PNG,
            std::vector<uint8_t>(png.begin(), png.begin() + png.size() / 2)
        );

        // Valid, but resizing it to a square would need gigabytes
        fetcher->add_ok(URL_SLIVER, ::make_png_bytes(1, 20000));
        fetcher->add_ok(
            URL_RGBA, ::make_png_bytes(64, 48, imgfetch::PixelFormat::rgba)
        );
        fetcher->add_ok(
            URL_GRAY, ::make_png_bytes(50, 50, imgfetch::PixelFormat::gray)
        );

        {
            imgfetch::FetchResult res;
            res.status_code = 404;
            res.final_url = URL_404;
            res.body = "Not Found";
            fetcher->add(URL_404, std::move(res));
        }

        {
            // Imgur placeholder served with 200 after a redirect
            imgfetch::FetchResult res;
            res.status_code = 200;
            res.final_url = "https://i.imgur.com/removed.png";
            const auto body = ::make_png_bytes(161, 81);
            res.body.assign(body.begin(), body.end());
            fetcher->add(URL_REMOVED, std::move(res));
        }

        {
            imgfetch::FetchResult res;
            res.status_code = 200;
            res.final_url = URL_HTML;
            res.body = "<html><body>Rate limited</body></html>";
            fetcher->add(URL_HTML, std::move(res));
        }

        return fetcher;
    }


    void test_success(
        imgfetch::test::Checker& chk,
        const std::shared_ptr<FakeFetcher>& fetcher,
        const imgfetch::Path& dir
    ) {
        const imgfetch::ImageDownloader dl{ 512, fetcher };
        chk.expect(dl.target_size() == 512, "target size kept");

        {
            const auto out = dir / "landscape.jpg";
            chk.expect(dl.download(URL_LANDSCAPE, out), "landscape downloads");
            const auto img = ::load_image(out);
            if (chk.expect(img.has_value(), "landscape readable")) {
                chk.expect(img->width == 512, "landscape width");
                chk.expect(img->height == 512, "landscape height");
                chk.expect(
                    img->format == imgfetch::PixelFormat::rgb, "landscape rgb"
                );
            }
            chk.expect(
                !::exists(imgfetch::path_concat(out, ".tmp")),
                "no temp file left behind"
            );
        }

        {
            const auto out = dir / "portrait.png";
            chk.expect(dl.download(URL_PORTRAIT, out), "portrait downloads");
            const auto img = ::load_image(out);
            if (chk.expect(img.has_value(), "portrait readable")) {
                chk.expect(img->width == 512, "portrait width");
                chk.expect(img->height == 512, "portrait height");
            }
        }

        {
            const auto out = dir / "alpha.png";
            chk.expect(dl.download(URL_RGBA, out), "rgba downloads");
            const auto img = ::load_image(out);
            if (chk.expect(img.has_value(), "rgba readable")) {
                chk.expect(
                    img->format == imgfetch::PixelFormat::rgb,
                    "alpha dropped on save"
                );
            }
        }

        {
            const auto out = dir / "gray.png";
            chk.expect(dl.download(URL_GRAY, out), "gray downloads");
            const auto img = ::load_image(out);
            if (chk.expect(img.has_value(), "gray readable")) {
                chk.expect(
                    img->format == imgfetch::PixelFormat::rgb,
                    "gray saved as rgb"
                );
            }
        }

        // Missing parent directories are created
        {
            const auto out = dir / "a" / "b" / "c" / "nested.jpg";
            chk.expect(dl.download(URL_PORTRAIT, out), "nested downloads");
            chk.expect(::exists(out), "nested file exists");
        }

        // Same input, same bytes
        {
            const auto first = dir / "again1.png";
            const auto second = dir / "again2.png";
            chk.expect(dl.download(URL_LANDSCAPE, first), "first download");
            chk.expect(dl.download(URL_LANDSCAPE, second), "second download");
            chk.expect(
                imgfetch::read_file(first) == imgfetch::read_file(second),
                "downloads are deterministic"
            );
        }

        // Overwrites an existing destination
        {
            const auto out = dir / "overwrite.png";
            const std::string junk = "junk";
            const auto wr = imgfetch::write_file_atomic(out, junk);
            chk.expect(wr.has_value(), "junk written");
            chk.expect(dl.download(URL_PORTRAIT, out), "overwrite downloads");
            chk.expect(::load_image(out).has_value(), "overwritten is image");
        }
    }

    void test_no_resize(
        imgfetch::test::Checker& chk,
        const std::shared_ptr<FakeFetcher>& fetcher,
        const imgfetch::Path& dir
    ) {
        const imgfetch::ImageDownloader dl{ -1, fetcher };

        const auto out = dir / "original.png";
        chk.expect(dl.download(URL_PORTRAIT, out), "unresized downloads");
        const auto img = ::load_image(out);
        if (chk.expect(img.has_value(), "unresized readable")) {
            chk.expect(img->width == 400, "original width kept");
            chk.expect(img->height == 600, "original height kept");
        }
    }

    void test_failures(
        imgfetch::test::Checker& chk,
        const std::shared_ptr<FakeFetcher>& fetcher,
        const imgfetch::Path& dir
    ) {
        using imgfetch::DownloadStatus;
        const imgfetch::ImageDownloader dl{ 224, fetcher };

        struct Case {
            const char* url_;
            const char* file_name_;
            DownloadStatus expected_;
        };

        const Case cases[] = {
            { URL_404, "404.jpg", DownloadStatus::http_status_failure },
            { URL_REMOVED, "removed.jpg", DownloadStatus::dead_link_sentinel },
            { URL_HTML, "html.jpg", DownloadStatus::decode_failure },
            { URL_OFFLINE, "offline.jpg", DownloadStatus::transport_failure },
            { URL_PORTRAIT, "portrait.bmp", DownloadStatus::encode_failure },
            { URL_CUT_JPEG, "cut_jpeg.jpg", DownloadStatus::decode_failure },
            { URL_CUT_PNG, "cut_png.jpg", DownloadStatus::decode_failure },
            { URL_SLIVER, "sliver.jpg", DownloadStatus::decode_failure },
        };

        for (const auto& c : cases) {
            const auto out = dir / c.file_name_;
            const auto what = std::string(c.file_name_);

            const auto res = dl.download_ex(c.url_, out);
            chk.expect(!res.ok(), what + " fails");
            chk.expect(res.status_ == c.expected_, what + " status");
            chk.expect(!res.message_.empty(), what + " has message");
            chk.expect(!::exists(out), what + " leaves no file");
            chk.expect(!dl.download(c.url_, out), what + " returns false");
        }

        // Target far beyond what the sliver can be resized to in memory
        {
            const imgfetch::ImageDownloader huge{ 100000, fetcher };
            const auto out = dir / "huge_target.jpg";
            const auto res = huge.download_ex(URL_SLIVER, out);
            chk.expect(
                res.status_ == DownloadStatus::decode_failure,
                "oversize target is a decode failure"
            );
            chk.expect(!::exists(out), "oversize target leaves no file");
        }

        {
            const imgfetch::ImageDownloader dl_throw{
                224, std::make_shared<ThrowingFetcher>()
            };
            const auto res = dl_throw.download_ex(
                URL_PORTRAIT, dir / "thrown.jpg"
            );
            chk.expect(
                res.status_ == DownloadStatus::transport_failure,
                "throwing fetcher is a transport failure"
            );
        }

        const imgfetch::ImageDownloader no_fetcher{ 224, nullptr };
        chk.expect(
            no_fetcher.download_ex(URL_PORTRAIT, dir / "none.jpg").status_ ==
                DownloadStatus::transport_failure,
            "missing fetcher is a transport failure"
        );

        // Parent path is a regular file
        {
            const auto blocker = dir / "blocker";
            const std::string junk = "x";
            chk.expect(
                imgfetch::ensure_parent_dir(blocker).has_value(),
                "failures dir created"
            );
            const auto wr = imgfetch::write_file_atomic(blocker, junk);
            chk.expect(wr.has_value(), "blocker written");

            const auto res = dl.download_ex(URL_PORTRAIT, blocker / "a.jpg");
            chk.expect(
                res.status_ == DownloadStatus::filesystem_failure,
                "unwritable destination"
            );
        }

        chk.expect(
            std::string(imgfetch::to_str(DownloadStatus::dead_link_sentinel)) ==
                "dead_link_sentinel",
            "status name"
        );
    }

    void test_batch(
        imgfetch::test::Checker& chk,
        const std::shared_ptr<FakeFetcher>& fetcher,
        const imgfetch::Path& dir
    ) {
        const imgfetch::ImageDownloader dl{ 64, fetcher };

        const std::vector<imgfetch::AnnotationEntry> entries{
            { "p1", "pics", URL_PORTRAIT },
            { "l1", "pics", URL_LANDSCAPE },
            { "a1", "itookapicture", URL_RGBA },
            { "gone", "pics", URL_404 },
            { "removed", "earthporn", URL_REMOVED },
            { "offline", "earthporn", URL_OFFLINE },
        };

        // Already present, must not be touched
        const auto existing = imgfetch::make_save_path(dir, entries[1]);
        {
            const auto dir_res = imgfetch::ensure_parent_dir(existing);
            chk.expect(dir_res.has_value(), "batch dir created");
            const std::string marker = "keep me";
            const auto wr = imgfetch::write_file_atomic(existing, marker);
            chk.expect(wr.has_value(), "marker written");
        }

        const auto summary = imgfetch::download_batch(dl, entries, dir, 3);
        chk.expect(summary.total_ == 6, "batch total");
        chk.expect(summary.skipped_ == 1, "batch skipped");
        chk.expect(summary.succeeded_ == 2, "batch succeeded");
        chk.expect(summary.failed_ == 3, "batch failed");

        const auto kept = imgfetch::read_file(existing);
        chk.expect(
            std::string(kept.begin(), kept.end()) == "keep me",
            "existing file untouched"
        );

        const auto p1 = ::load_image(dir / "pics" / "p1.jpg");
        if (chk.expect(p1.has_value(), "batch output readable")) {
            chk.expect(p1->width == 64, "batch output width");
            chk.expect(p1->height == 64, "batch output height");
        }
        chk.expect(
            ::exists(dir / "itookapicture" / "a1.jpg"), "batch subreddit dir"
        );
        chk.expect(!::exists(dir / "pics" / "gone.jpg"), "failed not saved");

        // Second run finds everything that succeeded
        const auto rerun = imgfetch::download_batch(dl, entries, dir, 1);
        chk.expect(rerun.skipped_ == 3, "rerun skips saved images");
        chk.expect(rerun.succeeded_ == 0, "rerun downloads nothing new");
        chk.expect(rerun.failed_ == 3, "rerun retries failures");

        const auto empty = imgfetch::download_batch(dl, {}, dir, 4);
        chk.expect(empty.total_ == 0, "empty batch");
    }

}  // namespace


int main() {
    imgfetch::test::Checker chk;

    const auto fetcher = ::make_fetcher();
    const auto dir = imgfetch::test::make_temp_dir("downloader");

    ::test_success(chk, fetcher, dir / "success");
    ::test_no_resize(chk, fetcher, dir / "no_resize");
    ::test_failures(chk, fetcher, dir / "failures");
    ::test_batch(chk, fetcher, dir / "batch");

    return chk.finish("downloader");
}
