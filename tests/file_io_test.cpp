#include <chrono>
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "spatialbook/file_io.hpp"

namespace {

    std::filesystem::path make_temp_dir() {
        const auto base = std::filesystem::temp_directory_path();
        const auto dir  = base / ("spatialbook-file-io-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(dir);
        return dir;
    }

}

TEST(FileIo, AtomicWriteReplacesContentsAndLeavesNoTempFile) {
    const auto dir  = make_temp_dir();
    const auto path = dir / "nested" / "index.json";

    EXPECT_FALSE(spatialbook::write_text_file_atomic(path, "first").has_value());
    EXPECT_FALSE(spatialbook::write_text_file_atomic(path, "second").has_value());

    EXPECT_EQ(spatialbook::read_text_file(path), "second");
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    std::filesystem::remove_all(dir);
}

TEST(FileIo, ReadMissingFileReturnsNullopt) {
    const auto dir = make_temp_dir();

    EXPECT_FALSE(spatialbook::read_text_file(dir / "missing.json").has_value());
    EXPECT_FALSE(spatialbook::read_text_file(dir).has_value());

    std::filesystem::remove_all(dir);
}

TEST(FileIo, FailedWriteKeepsPreviousContents) {
    const auto dir  = make_temp_dir();
    const auto path = dir / "index.json";
    ASSERT_FALSE(spatialbook::write_text_file_atomic(path, "stable").has_value());
    std::filesystem::create_directories(path.string() + ".tmp");

    EXPECT_TRUE(spatialbook::write_text_file_atomic(path, "broken").has_value());
    EXPECT_EQ(spatialbook::read_text_file(path), "stable");

    std::filesystem::remove_all(dir);
}
