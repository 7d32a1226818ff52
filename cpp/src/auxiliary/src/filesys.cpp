#include "imgfetch/auxiliary/filesys.hpp"

#include <format>
#include <fstream>


namespace imgfetch {

    bool read_file(const Path& path, std::vector<uint8_t>& out) {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs)
            return false;

        ifs.seekg(0, std::ios::end);
        const auto file_size = ifs.tellg();
        ifs.seekg(0, std::ios::beg);
        out.resize(static_cast<size_t>(file_size));
        ifs.read(
            reinterpret_cast<char*>(out.data()),
            static_cast<std::streamsize>(file_size)
        );
        return static_cast<size_t>(ifs.gcount()) == out.size();
    }

    std::vector<uint8_t> read_file(const Path& path) {
        std::vector<uint8_t> data;
        if (!read_file(path, data)) {
            return {};
        }
        return data;
    }

    ErrStr ensure_parent_dir(const Path& path) {
        const auto parent = path.parent_path();
        if (parent.empty())
            return {};

        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(std::format(
                "Failed to create directory {}: {}", tostr(parent), ec.message()
            ));
        }

        return {};
    }

    ErrStr write_file_atomic(const Path& path, const void* data, size_t size) {
        const auto tmp_path = path_concat(path, ".tmp");

        {
            std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
            if (!ofs)
                return std::unexpected("Cannot open file: " + tostr(tmp_path));

            ofs.write(
                reinterpret_cast<const char*>(data),
                static_cast<std::streamsize>(size)
            );
            ofs.close();

            if (!ofs) {
                std::error_code ec;
                fs::remove(tmp_path, ec);
                return std::unexpected("Write error: " + tostr(tmp_path));
            }
        }

        std::error_code ec;
        fs::rename(tmp_path, path, ec);
        if (ec) {
            std::error_code rm_ec;
            fs::remove(tmp_path, rm_ec);
            return std::unexpected(std::format(
                "Failed to move {} into place: {}", tostr(path), ec.message()
            ));
        }

        return {};
    }

}  // namespace imgfetch
