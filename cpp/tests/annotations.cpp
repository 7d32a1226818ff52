#include <fstream>

#include "checker.hpp"
#include "imgfetch/fetch/annotations.hpp"
#include "imgfetch/fetch/http_fetcher.hpp"


namespace {

    const char* const SAMPLE = R"({
        "info": { "url": "https://redcaps.xyz", "version": "1.0" },
        "annotations": [
            {
                "image_id": "gi3sk9",
                "author": "someone",
                "url": "https://i.redd.it/abc.jpg",
                "raw_caption": "my cat",
                "caption": "my cat",
                "subreddit": "cats",
                "score": 12,
                "created_utc": 1590000000.0
            },
            {
                "image_id": "8q2w0x",
                "url": "https://i.imgur.com/xyz.jpg",
                "caption": "sunset over the lake",
                "subreddit": "earthporn"
            },
            {
                "image_id": "x99",
                "url": "https://i.redd.it/zzz.png",
                "caption": "a bird",
                "subreddit": "birdpics"
            }
        ]
    })";

    void test_parse(imgfetch::test::Checker& chk) {
        const auto ann = imgfetch::Annotations::from_json(
            nlohmann::json::parse(SAMPLE)
        );
        if (!chk.expect(ann.has_value(), "sample parses"))
            return;

        chk.expect(ann->size() == 3, "three entries");
        const auto& e = ann->entries()[1];
        chk.expect(e.image_id_ == "8q2w0x", "image id");
        chk.expect(e.subreddit_ == "earthporn", "subreddit");
        chk.expect(e.url_ == "https://i.imgur.com/xyz.jpg", "url");

        const auto p = imgfetch::make_save_path("/data/images", e);
        chk.expect(
            imgfetch::tostr(p) == "/data/images/earthporn/8q2w0x.jpg",
            "save path layout"
        );

        const char* const bad_inputs[] = {
            R"([])",
            R"({ "info": {} })",
            R"({ "annotations": {} })",
            R"({ "annotations": [ 5 ] })",
            R"({ "annotations": [ { "image_id": "a", "url": "u" } ] })",
            R"({ "annotations": [
                { "image_id": 1, "subreddit": "s", "url": "u" } ] })",
            // Would escape the save directory
            R"({ "annotations": [
                { "image_id": "a", "subreddit": "/etc", "url": "u" } ] })",
            R"({ "annotations": [
                { "image_id": "a", "subreddit": "..", "url": "u" } ] })",
            R"({ "annotations": [
                { "image_id": "../../x", "subreddit": "s", "url": "u" } ] })",
            R"({ "annotations": [
                { "image_id": "", "subreddit": "s", "url": "u" } ] })",
        };
        for (const auto input : bad_inputs) {
            chk.expect(
                !imgfetch::Annotations::from_json(nlohmann::json::parse(input)),
                std::string("rejected: ") + input
            );
        }

        const auto empty = imgfetch::Annotations::from_json(
            nlohmann::json::parse(R"({ "annotations": [] })")
        );
        chk.expect(empty && empty->size() == 0, "empty list is fine");
    }

    void test_retain_and_save(imgfetch::test::Checker& chk) {
        auto ann = imgfetch::Annotations::from_json(
            nlohmann::json::parse(SAMPLE)
        );
        if (!chk.expect(ann.has_value(), "sample parses for retain"))
            return;

        const auto removed = ann->retain_if(
            [](const imgfetch::AnnotationEntry& e) {
                return e.subreddit_ != "earthporn";
            }
        );
        chk.expect(removed == 1, "one entry removed");
        chk.expect(ann->size() == 2, "two entries left");
        chk.expect(ann->entries()[1].image_id_ == "x99", "order kept");

        const auto& items = ann->json().at("annotations");
        chk.expect(items.size() == 2, "json array shrunk");
        chk.expect(
            items[0].at("raw_caption") == "my cat", "extra fields carried"
        );
        chk.expect(ann->json().contains("info"), "info block kept");

        const auto dir = imgfetch::test::make_temp_dir("annotations");
        const auto path = dir / "cats_2020.json";
        const auto saved = ann->save(path);
        chk.expect(saved.has_value(), "annotations saved");

        const auto loaded = imgfetch::Annotations::load(path);
        if (chk.expect(loaded.has_value(), "annotations reload")) {
            chk.expect(loaded->size() == 2, "reloaded size");
            chk.expect(loaded->json() == ann->json(), "reloaded json equal");
        }

        chk.expect(
            !imgfetch::Annotations::load(dir / "missing.json"),
            "missing file fails"
        );

        {
            std::ofstream ofs(dir / "broken.json");
            ofs << "{ \"annotations\": [";
        }
        chk.expect(
            !imgfetch::Annotations::load(dir / "broken.json"),
            "broken json fails"
        );
    }

    void test_split_url(imgfetch::test::Checker& chk) {
        {
            const auto s = imgfetch::split_url("https://i.redd.it/abc.jpg");
            if (chk.expect(s.has_value(), "https url splits")) {
                chk.expect(
                    s->scheme_host_port_ == "https://i.redd.it", "https host"
                );
                chk.expect(s->path_ == "/abc.jpg", "https path");
            }
        }

        {
            const auto s = imgfetch::split_url(
                "HTTP://localhost:8080/img?id=3&x=y#frag"
            );
            if (chk.expect(s.has_value(), "http url with port splits")) {
                chk.expect(
                    s->scheme_host_port_ == "http://localhost:8080",
                    "scheme lowered, port kept"
                );
                chk.expect(s->path_ == "/img?id=3&x=y", "query kept");
            }
        }

        {
            const auto s = imgfetch::split_url("https://imgur.com");
            if (chk.expect(s.has_value(), "bare host splits"))
                chk.expect(s->path_ == "/", "bare host path");
        }

        chk.expect(!imgfetch::split_url("ftp://x.org/a.jpg"), "ftp rejected");
        chk.expect(!imgfetch::split_url("not a url"), "garbage rejected");
        chk.expect(!imgfetch::split_url(""), "empty rejected");
    }

}  // namespace


int main() {
    imgfetch::test::Checker chk;

    ::test_parse(chk);
    ::test_retain_and_save(chk);
    ::test_split_url(chk);

    return chk.finish("annotations");
}
