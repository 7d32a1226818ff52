#include "imgfetch/fetch/http_fetcher.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <regex>

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>


namespace {

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](char c) {
            return static_cast<char>(
                std::tolower(static_cast<unsigned char>(c))
            );
        });
        return s;
    }

}  // namespace


namespace imgfetch {

    std::expected<SplitUrl, std::string> split_url(const std::string& url) {
        static const std::regex re{
            R"(^([A-Za-z][A-Za-z0-9+.\-]*)://([^/?#]+)([^#]*))"
        };

        std::smatch m;
        if (!std::regex_search(url, m, re))
            return std::unexpected("Malformed URL: " + url);

        const auto scheme = ::to_lower(m[1].str());
        if (scheme != "http" && scheme != "https")
            return std::unexpected("Unsupported URL scheme: " + scheme);

        SplitUrl out;
        out.scheme_host_port_ = scheme + "://" + m[2].str();
        out.path_ = m[3].str();
        if (out.path_.empty() || out.path_.front() != '/')
            out.path_.insert(out.path_.begin(), '/');

        return out;
    }


    HttpFetcher::HttpFetcher(const Options& options) : options_(options) {}

    std::expected<FetchResult, std::string> HttpFetcher::fetch(
        const std::string& url
    ) const {
        const auto split = split_url(url);
        if (!split)
            return std::unexpected(split.error());

        try {
            httplib::Client cli{ split->scheme_host_port_ };
            if (!cli.is_valid()) {
                return std::unexpected(
                    "Cannot create HTTP client for " + split->scheme_host_port_
                );
            }

            cli.set_follow_location(true);
            cli.set_connection_timeout(options_.connection_timeout_sec_, 0);
            cli.set_read_timeout(options_.read_timeout_sec_, 0);

            const httplib::Headers headers{
                { "User-Agent", options_.user_agent_ },
            };

            auto res = cli.Get(split->path_, headers);
            if (!res) {
                return std::unexpected(std::format(
                    "HTTP request failed: {}", httplib::to_string(res.error())
                ));
            }

            FetchResult out;
            out.status_code = res->status;
            // httplib stores the last redirect target here
            out.final_url = res->location.empty() ? url : res->location;
            out.body = std::move(res->body);
            return out;
        } catch (const std::exception& e) {
            return std::unexpected(
                std::format("HTTP client error: {}", e.what())
            );
        }
    }

}  // namespace imgfetch
