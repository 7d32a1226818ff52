#pragma once

#include <expected>
#include <string>

#include "imgfetch/fetch/fetcher.hpp"


namespace imgfetch {

    struct SplitUrl {
        // e.g. "https://i.redd.it" or "http://localhost:8080"
        std::string scheme_host_port_;
        // Path plus query, always starts with '/'
        std::string path_;
    };

    std::expected<SplitUrl, std::string> split_url(const std::string& url);


    class HttpFetcher : public IFetcher {

    public:
        struct Options {
            int connection_timeout_sec_ = 10;
            int read_timeout_sec_ = 30;
            std::string user_agent_ = "imgfetch/1.0";
        };

    public:
        HttpFetcher() = default;
        explicit HttpFetcher(const Options& options);

        // Follows redirects. One client per call, nothing shared.
        std::expected<FetchResult, std::string> fetch(
            const std::string& url
        ) const override;

    private:
        Options options_;
    };

}  // namespace imgfetch
