#ifndef SPATIALBOOK_FILE_IO_HPP
#define SPATIALBOOK_FILE_IO_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace spatialbook {

    std::optional<std::string> read_text_file(const std::filesystem::path& path);

    // Writes to "<path>.tmp" and renames over the target; the previous file survives a failed write.
    std::optional<std::string> write_text_file_atomic(const std::filesystem::path& path, std::string_view contents);

} // namespace spatialbook

#endif // SPATIALBOOK_FILE_IO_HPP
