#include "spatialbook/file_io.hpp"

#include <fstream>
#include <sstream>

namespace spatialbook {

    std::optional<std::string> read_text_file(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec) || ec) {
            return std::nullopt;
        }
        std::ifstream input(path, std::ios::binary);
        if (!input.good()) {
            return std::nullopt;
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        return buffer.str();
    }

    std::optional<std::string> write_text_file_atomic(const std::filesystem::path& path, std::string_view contents) {
        std::error_code ec;
        const auto      parent = path.parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return "failed to create directory " + parent.string();
            }
        }

        const auto    tempname = path.string() + ".tmp";
        std::ofstream output(tempname, std::ios::binary | std::ios::trunc);
        if (!output.good()) {
            return "failed to open " + tempname;
        }
        output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        output.close();
        if (!output.good()) {
            std::filesystem::remove(tempname, ec);
            return "failed to write " + tempname;
        }
        std::filesystem::rename(tempname, path, ec);
        if (ec) {
            std::filesystem::remove(tempname, ec);
            return "failed to finalize " + path.string();
        }
        return std::nullopt;
    }

} // namespace spatialbook
