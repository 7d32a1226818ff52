#pragma once

#include <cstdint>
#include <vector>

#include "imgfetch/auxiliary/err_str.hpp"
#include "imgfetch/auxiliary/path.hpp"


namespace imgfetch {

    bool read_file(const Path& path, std::vector<uint8_t>& out);

    std::vector<uint8_t> read_file(const Path& path);

    // Creates every missing directory above `path`. Existing ones are fine.
    ErrStr ensure_parent_dir(const Path& path);

    // Writes "<path>.tmp" first and renames it over `path`. A failed write
    // never leaves a truncated file at `path`.
    ErrStr write_file_atomic(const Path& path, const void* data, size_t size);

    template <typename TContainer>
    ErrStr write_file_atomic(const Path& path, const TContainer& data) {
        return write_file_atomic(
            path,
            static_cast<const void*>(data.data()),
            data.size() * sizeof(typename TContainer::value_type)
        );
    }

}  // namespace imgfetch
