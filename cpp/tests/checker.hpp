#pragma once

#include <print>
#include <source_location>
#include <string>
#include <string_view>

#include "imgfetch/auxiliary/path.hpp"


namespace imgfetch::test {

    class Checker {

    public:
        bool expect(
            bool cond,
            std::string_view what,
            std::source_location loc = std::source_location::current()
        ) {
            ++count_;
            if (!cond) {
                ++failures_;
                std::println(
                    "FAILED {}:{}: {}", loc.file_name(), loc.line(), what
                );
            }
            return cond;
        }

        int finish(std::string_view name) const {
            std::println(
                "{}: {} checks, {} failed", name, count_, failures_
            );
            return failures_ == 0 ? 0 : 1;
        }

    private:
        int count_ = 0;
        int failures_ = 0;
    };


    // Fresh empty directory under the system temp dir
    inline Path make_temp_dir(std::string_view name) {
        const auto dir = fs::temp_directory_path() /
                         fromstr("imgfetch_test_" + std::string(name));
        std::error_code ec;
        fs::remove_all(dir, ec);
        fs::create_directories(dir);
        return dir;
    }

}  // namespace imgfetch::test
