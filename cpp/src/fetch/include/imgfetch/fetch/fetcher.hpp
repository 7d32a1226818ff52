#pragma once

#include <expected>
#include <string>


namespace imgfetch {

    struct FetchResult {
        int status_code = 0;
        // URL after following redirects
        std::string final_url;
        std::string body;
    };


    // Must be safe to call from several threads at once. Errors are transport
    // failures only, a non-200 response is a successful fetch.
    struct IFetcher {
        virtual ~IFetcher() = default;
        virtual std::expected<FetchResult, std::string> fetch(
            const std::string& url
        ) const = 0;
    };

}  // namespace imgfetch
