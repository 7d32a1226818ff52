#pragma once

#include <expected>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "imgfetch/auxiliary/err_str.hpp"
#include "imgfetch/auxiliary/path.hpp"


namespace imgfetch {

    struct AnnotationEntry {
        std::string image_id_;
        std::string subreddit_;
        std::string url_;
    };


    // RedCaps annotation file:
    // { "info": {...}, "annotations": [ { "image_id", "subreddit", "url" } ] }
    // Other fields are carried through untouched.
    class Annotations {

    public:
        static std::expected<Annotations, std::string> load(const Path& path);
        static std::expected<Annotations, std::string> from_json(
            nlohmann::json json_data
        );

        ErrStr save(const Path& path) const;

        const std::vector<AnnotationEntry>& entries() const { return entries_; }
        size_t size() const { return entries_.size(); }

        // Drops every entry for which `keep` returns false
        size_t retain_if(
            const std::function<bool(const AnnotationEntry&)>& keep
        );

        const nlohmann::json& json() const { return json_; }

    private:
        nlohmann::json json_;
        std::vector<AnnotationEntry> entries_;
    };


    // <save_dir>/<subreddit>/<image_id>.jpg
    Path make_save_path(const Path& save_dir, const AnnotationEntry& entry);

}  // namespace imgfetch
