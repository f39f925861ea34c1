#include <chrono>
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "spatialbook/config.hpp"
#include "spatialbook/file_io.hpp"

namespace {

    std::filesystem::path make_temp_dir() {
        const auto base = std::filesystem::temp_directory_path();
        const auto dir  = base / ("spatialbook-config-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(dir);
        return dir;
    }

}

TEST(ConfigParse, ParsesSaveDestination) {
    EXPECT_EQ(spatialbook::parse_save_destination("local"), spatialbook::SaveDestinationKind::kLocal);
    EXPECT_EQ(spatialbook::parse_save_destination(" Remote "), spatialbook::SaveDestinationKind::kRemote);
    EXPECT_EQ(spatialbook::parse_save_destination("cloud"), std::nullopt);
    EXPECT_EQ(spatialbook::save_destination_name(spatialbook::SaveDestinationKind::kRemote), "remote");
}

TEST(ConfigDefaults, MatchDocumentedValues) {
    const spatialbook::Config config;

    EXPECT_TRUE(config.autosave_enabled);
    EXPECT_TRUE(config.save_to_local);
    EXPECT_FALSE(config.save_to_remote);
    EXPECT_EQ(config.autosave_interval, std::chrono::seconds(30));
    EXPECT_EQ(config.movement_debounce, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.workspace_debounce, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.remote_timeout, std::chrono::seconds(10));
    EXPECT_EQ(config.remote_server_url, "http://localhost:8888");
}

TEST(ConfigOverrides, AppliesOnlySetFields) {
    spatialbook::ConfigOverrides overrides;
    overrides.save_on_movement  = false;
    overrides.autosave_interval = std::chrono::seconds(0);
    overrides.remote_server_url = "https://notebooks.example";

    const auto merged = spatialbook::apply_overrides(spatialbook::Config{}, overrides);

    EXPECT_FALSE(merged.save_on_movement);
    EXPECT_TRUE(merged.save_on_focus_loss);
    EXPECT_EQ(merged.autosave_interval, std::chrono::seconds(0));
    EXPECT_EQ(merged.remote_server_url, "https://notebooks.example");
    EXPECT_EQ(merged.workspace_debounce, std::chrono::milliseconds(1000));
}

TEST(ConfigOverrides, NormalizesStrings) {
    EXPECT_EQ(spatialbook::normalize_override_string("  value "), "value");
    EXPECT_EQ(spatialbook::normalize_override_string("   "), std::nullopt);
}

TEST(ConfigFile, MissingFileYieldsEmptyOverrides) {
    std::string error;
    const auto  overrides = spatialbook::load_config_overrides("/nonexistent/spatialbook/config.json", &error);

    ASSERT_TRUE(overrides.has_value());
    EXPECT_FALSE(overrides->autosave_enabled.has_value());
    EXPECT_TRUE(error.empty());
}

TEST(ConfigFile, ReadsSettings) {
    const auto dir  = make_temp_dir();
    const auto path = dir / "config.json";
    ASSERT_FALSE(spatialbook::write_text_file_atomic(path, R"({
        "save_on_focus_loss": false,
        "movement_debounce_ms": 250,
        "autosave_interval_seconds": 0,
        "destinations": ["local", "remote"],
        "remote_server_url": " http://lab:9000 "
    })")
                     .has_value());

    std::string error;
    const auto  overrides = spatialbook::load_config_overrides(path, &error);

    ASSERT_TRUE(overrides.has_value()) << error;
    const auto config = spatialbook::apply_overrides(spatialbook::Config{}, *overrides);
    EXPECT_FALSE(config.save_on_focus_loss);
    EXPECT_EQ(config.movement_debounce, std::chrono::milliseconds(250));
    EXPECT_EQ(config.autosave_interval, std::chrono::seconds(0));
    EXPECT_TRUE(config.save_to_local);
    EXPECT_TRUE(config.save_to_remote);
    EXPECT_EQ(config.remote_server_url, "http://lab:9000");

    std::filesystem::remove_all(dir);
}

TEST(ConfigFile, RejectsWrongTypes) {
    const auto dir  = make_temp_dir();
    const auto path = dir / "config.json";
    ASSERT_FALSE(spatialbook::write_text_file_atomic(path, R"({"save_on_movement": "yes"})").has_value());

    std::string error;
    EXPECT_FALSE(spatialbook::load_config_overrides(path, &error).has_value());
    EXPECT_EQ(error, "save_on_movement must be a boolean");

    ASSERT_FALSE(spatialbook::write_text_file_atomic(path, R"({"destinations": ["ftp"]})").has_value());
    EXPECT_FALSE(spatialbook::load_config_overrides(path, &error).has_value());
    EXPECT_EQ(error, R"(unknown save destination: "ftp")");

    ASSERT_FALSE(spatialbook::write_text_file_atomic(path, "{oops").has_value());
    EXPECT_FALSE(spatialbook::load_config_overrides(path, &error).has_value());

    std::filesystem::remove_all(dir);
}
