#pragma once

#include <expected>
#include <string>

#include <nlohmann/json.hpp>

#include "imgfetch/auxiliary/path.hpp"


namespace imgfetch {

    class FetcherConfigs {

    public:
        void fill_default();

        void import_json(const nlohmann::json& json_data);
        nlohmann::json export_json() const;

    public:
        // Shorter edge is resized to this and the longer edge center-cropped.
        // Non-positive disables all resizing.
        int target_size_;

        // Encoding settings
        int jpeg_quality_;
        double avif_quality_;
        int avif_speed_;

        // HTTP settings
        int connection_timeout_sec_;
        int read_timeout_sec_;
        std::string user_agent_;

        // Batch download
        int workers_;
    };


    // Loads `config_path`, or fills defaults if it does not exist. Either way
    // the result is written back so newly added keys show up in the file.
    std::expected<FetcherConfigs, std::string> load_or_create_configs(
        const Path& config_path
    );

}  // namespace imgfetch
