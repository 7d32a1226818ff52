#include <fstream>
#include <stdexcept>

#include "checker.hpp"
#include "imgfetch/auxiliary/fetcher_configs.hpp"


namespace {

    nlohmann::json read_json(const imgfetch::Path& path) {
        std::ifstream ifs(path);
        return nlohmann::json::parse(ifs);
    }

    void test_defaults(imgfetch::test::Checker& chk) {
        imgfetch::FetcherConfigs configs;
        configs.fill_default();

        chk.expect(configs.target_size_ == 512, "default target size");
        chk.expect(configs.jpeg_quality_ == 75, "default jpeg quality");
        chk.expect(configs.workers_ == 4, "default workers");
        chk.expect(configs.user_agent_ == "imgfetch/1.0", "default agent");

        // Missing keys fall back to defaults
        imgfetch::FetcherConfigs from_empty;
        from_empty.import_json(nlohmann::json::object());
        chk.expect(
            from_empty.export_json() == configs.export_json(),
            "empty object equals defaults"
        );
    }

    void test_import(imgfetch::test::Checker& chk) {
        const auto j = nlohmann::json::parse(R"({
            "target_size": -1,
            "jpeg_quality": 250,
            "avif_speed": -3,
            "workers": 0,
            "user_agent": "redcaps-bot",
            "unrelated_key": [1, 2, 3]
        })");

        imgfetch::FetcherConfigs configs;
        configs.import_json(j);
        chk.expect(configs.target_size_ == -1, "resize disabled");
        chk.expect(configs.jpeg_quality_ == 100, "jpeg quality clamped");
        chk.expect(configs.avif_speed_ == 0, "avif speed clamped");
        chk.expect(configs.workers_ == 1, "at least one worker");
        chk.expect(configs.user_agent_ == "redcaps-bot", "agent imported");

        const auto exported = configs.export_json();
        chk.expect(exported.at("target_size") == -1, "exported size");
        chk.expect(!exported.contains("unrelated_key"), "unknown key dropped");

        bool threw = false;
        try {
            configs.import_json(nlohmann::json::parse(R"({"workers": "a"})"));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        chk.expect(threw, "wrong type throws");

        threw = false;
        try {
            configs.import_json(nlohmann::json::array());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        chk.expect(threw, "non-object root throws");
    }

    void test_load_or_create(imgfetch::test::Checker& chk) {
        const auto dir = imgfetch::test::make_temp_dir("configs");
        const auto path = dir / "imgfetch_configs.json";

        {
            const auto configs = imgfetch::load_or_create_configs(path);
            if (chk.expect(configs.has_value(), "missing file gives defaults"))
                chk.expect(configs->target_size_ == 512, "created defaults");
            chk.expect(imgfetch::fs::exists(path), "config file created");
            chk.expect(
                ::read_json(path).contains("avif_quality"),
                "created file has every key"
            );
        }

        {
            std::ofstream ofs(path);
            ofs << R"({ "target_size": 224 })";
        }
        {
            const auto configs = imgfetch::load_or_create_configs(path);
            if (chk.expect(configs.has_value(), "partial file loads")) {
                chk.expect(configs->target_size_ == 224, "loaded target size");
                chk.expect(configs->workers_ == 4, "missing key defaulted");
            }
            const auto j = ::read_json(path);
            chk.expect(j.contains("workers"), "missing keys written back");
            chk.expect(j.at("target_size") == 224, "user value kept");
        }

        {
            std::ofstream ofs(path);
            ofs << "{ not json";
        }
        chk.expect(
            !imgfetch::load_or_create_configs(path), "malformed file fails"
        );
    }

}  // namespace


int main() {
    imgfetch::test::Checker chk;

    ::test_defaults(chk);
    ::test_import(chk);
    ::test_load_or_create(chk);

    return chk.finish("configs");
}
