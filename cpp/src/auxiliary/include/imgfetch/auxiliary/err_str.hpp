#pragma once

#include <expected>
#include <string>


namespace imgfetch {

    // Empty on success, error message otherwise
    using ErrStr = std::expected<void, std::string>;

}  // namespace imgfetch
