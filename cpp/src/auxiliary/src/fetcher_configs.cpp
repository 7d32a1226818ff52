#include "imgfetch/auxiliary/fetcher_configs.hpp"

#include <algorithm>
#include <fstream>
#include <print>


namespace {

    constexpr int DEFAULT_TARGET_SIZE = 512;
    constexpr int DEFAULT_JPEG_QUALITY = 75;
    constexpr double DEFAULT_AVIF_QUALITY = 70.0;
    constexpr int DEFAULT_AVIF_SPEED = 6;
    constexpr int DEFAULT_CONNECTION_TIMEOUT = 10;
    constexpr int DEFAULT_READ_TIMEOUT = 30;
    constexpr int DEFAULT_WORKERS = 4;
    const std::string DEFAULT_USER_AGENT = "imgfetch/1.0";

    template <typename T>
    T try_get(
        const nlohmann::json& j, const char* key, const T& default_value
    ) {
        if (!j.contains(key))
            return default_value;

        try {
            return j.at(key).get<T>();
        } catch (const std::exception& e) {
            throw std::runtime_error(
                "Invalid type for key '" + std::string(key) + "'"
            );
        }
    }

}  // namespace


// FetcherConfigs
namespace imgfetch {

    void FetcherConfigs::fill_default() {
        target_size_ = DEFAULT_TARGET_SIZE;

        jpeg_quality_ = DEFAULT_JPEG_QUALITY;
        avif_quality_ = DEFAULT_AVIF_QUALITY;
        avif_speed_ = DEFAULT_AVIF_SPEED;

        connection_timeout_sec_ = DEFAULT_CONNECTION_TIMEOUT;
        read_timeout_sec_ = DEFAULT_READ_TIMEOUT;
        user_agent_ = DEFAULT_USER_AGENT;

        workers_ = DEFAULT_WORKERS;
    }

    void FetcherConfigs::import_json(const nlohmann::json& json_data) {
        if (!json_data.is_object())
            throw std::runtime_error("Configs root must be a JSON object");

        target_size_ = try_get(json_data, "target_size", DEFAULT_TARGET_SIZE);

        jpeg_quality_ = try_get(
            json_data, "jpeg_quality", DEFAULT_JPEG_QUALITY
        );
        jpeg_quality_ = std::clamp(jpeg_quality_, 1, 100);
        avif_quality_ = try_get(
            json_data, "avif_quality", DEFAULT_AVIF_QUALITY
        );
        avif_quality_ = std::clamp(avif_quality_, 0.0, 100.0);
        avif_speed_ = try_get(json_data, "avif_speed", DEFAULT_AVIF_SPEED);
        avif_speed_ = std::clamp(avif_speed_, 0, 10);

        connection_timeout_sec_ = try_get(
            json_data, "connection_timeout_sec", DEFAULT_CONNECTION_TIMEOUT
        );
        read_timeout_sec_ = try_get(
            json_data, "read_timeout_sec", DEFAULT_READ_TIMEOUT
        );
        user_agent_ = try_get(json_data, "user_agent", DEFAULT_USER_AGENT);

        workers_ = std::max(try_get(json_data, "workers", DEFAULT_WORKERS), 1);
    }

    nlohmann::json FetcherConfigs::export_json() const {
        auto output = nlohmann::json::object();

        output["target_size"] = target_size_;

        output["jpeg_quality"] = jpeg_quality_;
        output["avif_quality"] = avif_quality_;
        output["avif_speed"] = avif_speed_;

        output["connection_timeout_sec"] = connection_timeout_sec_;
        output["read_timeout_sec"] = read_timeout_sec_;
        output["user_agent"] = user_agent_;

        output["workers"] = workers_;

        return output;
    }

}  // namespace imgfetch


namespace imgfetch {

    std::expected<FetcherConfigs, std::string> load_or_create_configs(
        const Path& config_path
    ) {
        FetcherConfigs configs;

        std::ifstream ifs(config_path);
        if (ifs) {
            nlohmann::json json_data;

            try {
                ifs >> json_data;
                configs.import_json(json_data);
            } catch (const std::exception& e) {
                return std::unexpected(e.what());
            }
        } else {
            std::println(
                "Configs: file not found, creating new one at {}",
                tostr(fs::absolute(config_path))
            );
            configs.fill_default();
        }
        ifs.close();

        std::ofstream ofs(config_path);
        if (ofs) {
            ofs << configs.export_json().dump(2);
            ofs << '\n';
        } else {
            std::println(
                "Configs: failed to write config file: {}", tostr(config_path)
            );
        }

        return configs;
    }

}  // namespace imgfetch
