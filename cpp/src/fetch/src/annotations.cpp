#include "imgfetch/fetch/annotations.hpp"

#include <format>
#include <fstream>


namespace {

    std::expected<std::string, std::string> get_str(
        const nlohmann::json& j, const char* key, size_t index
    ) {
        const auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return std::unexpected(std::format(
                "Annotation #{} has no string field '{}'", index, key
            ));
        }
        return it->get<std::string>();
    }

    // Used as a single path component, so no separators, no "." or ".."
    bool is_plain_name(const std::string& name) {
        if (name.empty() || name == "." || name == "..")
            return false;
        return name.find_first_of("/\\:") == std::string::npos &&
               name.find('\0') == std::string::npos;
    }

}  // namespace


namespace imgfetch {

    std::expected<Annotations, std::string> Annotations::load(
        const Path& path
    ) {
        std::ifstream ifs(path);
        if (!ifs)
            return std::unexpected("Cannot open annotations: " + tostr(path));

        nlohmann::json json_data;
        try {
            ifs >> json_data;
        } catch (const std::exception& e) {
            return std::unexpected(e.what());
        }

        return Annotations::from_json(std::move(json_data));
    }

    std::expected<Annotations, std::string> Annotations::from_json(
        nlohmann::json json_data
    ) {
        if (!json_data.is_object())
            return std::unexpected("Annotations root must be a JSON object");

        const auto it_ann = json_data.find("annotations");
        if (it_ann == json_data.end() || !it_ann->is_array())
            return std::unexpected("Missing 'annotations' array");

        Annotations out;
        out.entries_.reserve(it_ann->size());

        for (size_t i = 0; i < it_ann->size(); ++i) {
            const auto& item = (*it_ann)[i];
            if (!item.is_object()) {
                return std::unexpected(
                    std::format("Annotation #{} is not an object", i)
                );
            }

            auto image_id = ::get_str(item, "image_id", i);
            if (!image_id)
                return std::unexpected(image_id.error());
            auto subreddit = ::get_str(item, "subreddit", i);
            if (!subreddit)
                return std::unexpected(subreddit.error());
            auto url = ::get_str(item, "url", i);
            if (!url)
                return std::unexpected(url.error());

            if (!::is_plain_name(*image_id) || !::is_plain_name(*subreddit)) {
                return std::unexpected(std::format(
                    "Annotation #{} has an unsafe image_id or subreddit", i
                ));
            }

            out.entries_.push_back(AnnotationEntry{
                std::move(*image_id),
                std::move(*subreddit),
                std::move(*url),
            });
        }

        out.json_ = std::move(json_data);
        return out;
    }

    ErrStr Annotations::save(const Path& path) const {
        std::ofstream ofs(path);
        if (!ofs)
            return std::unexpected("Cannot write annotations: " + tostr(path));

        ofs << json_.dump();
        ofs << '\n';
        ofs.close();
        if (!ofs)
            return std::unexpected("Write error: " + tostr(path));

        return {};
    }

    size_t Annotations::retain_if(
        const std::function<bool(const AnnotationEntry&)>& keep
    ) {
        auto& src_items = json_.at("annotations");
        auto kept_items = nlohmann::json::array();
        std::vector<AnnotationEntry> kept_entries;

        for (size_t i = 0; i < entries_.size(); ++i) {
            if (!keep(entries_[i]))
                continue;

            kept_items.push_back(std::move(src_items[i]));
            kept_entries.push_back(std::move(entries_[i]));
        }

        const size_t removed = entries_.size() - kept_entries.size();
        src_items = std::move(kept_items);
        entries_ = std::move(kept_entries);
        return removed;
    }


    Path make_save_path(const Path& save_dir, const AnnotationEntry& entry) {
        return save_dir / fromstr(entry.subreddit_) /
               fromstr(entry.image_id_ + ".jpg");
    }

}  // namespace imgfetch
