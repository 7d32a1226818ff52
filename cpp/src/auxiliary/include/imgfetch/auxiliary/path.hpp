#pragma once

#include <filesystem>
#include <string>


namespace imgfetch {

    namespace fs = std::filesystem;

    using Path = std::filesystem::path;


    std::string tostr(const Path& path);

    Path fromstr(const std::string& str);

    Path path_concat(const Path& base, const std::string& suffix);

    // Extension including the dot, ASCII-lowercased. Empty if there is none.
    std::string lower_ext(const Path& path);

}  // namespace imgfetch
