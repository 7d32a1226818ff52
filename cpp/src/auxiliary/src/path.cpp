#include "imgfetch/auxiliary/path.hpp"

#include <algorithm>
#include <cctype>


namespace imgfetch {

    std::string tostr(const Path& path) {
        const auto u8str = path.generic_u8string();
        return std::string(u8str.begin(), u8str.end());
    }

    Path fromstr(const std::string& str) { return fs::u8path(str); }

    Path path_concat(const Path& base, const std::string& suffix) {
        return fromstr(tostr(base) + suffix);
    }

    std::string lower_ext(const Path& path) {
        auto ext = tostr(path.extension());
        std::transform(ext.begin(), ext.end(), ext.begin(), [](char c) {
            return static_cast<char>(
                std::tolower(static_cast<unsigned char>(c))
            );
        });
        return ext;
    }

}  // namespace imgfetch
