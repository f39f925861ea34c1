#include <stdexcept>

#include <gtest/gtest.h>

#include "spatialbook/paths.hpp"

TEST(PathsResolve, PrefersXdgDirectories) {
    const spatialbook::EnvConfig env{.home = "/home/tester", .xdg_config_home = "/tmp/xdg", .xdg_data_home = "/tmp/data"};
    const auto                   paths = spatialbook::resolve_paths(env);

    EXPECT_EQ(paths.config_dir, std::filesystem::path("/tmp/xdg/spatialbook"));
    EXPECT_EQ(paths.config_path, std::filesystem::path("/tmp/xdg/spatialbook/config.json"));
    EXPECT_EQ(paths.data_dir, std::filesystem::path("/tmp/data/spatialbook"));
    EXPECT_EQ(paths.metadata_index_path, std::filesystem::path("/tmp/data/spatialbook/workspace_metadata.json"));
    EXPECT_EQ(paths.workspaces_dir, std::filesystem::path("/tmp/data/spatialbook/Workspaces"));
    EXPECT_EQ(paths.autosave_dir, std::filesystem::path("/tmp/data/spatialbook/autosave"));
}

TEST(PathsResolve, FallsBackToHome) {
    const spatialbook::EnvConfig env{.home = "/home/tester", .xdg_config_home = std::nullopt, .xdg_data_home = std::nullopt};
    const auto                   paths = spatialbook::resolve_paths(env);

    EXPECT_EQ(paths.config_path, std::filesystem::path("/home/tester/.config/spatialbook/config.json"));
    EXPECT_EQ(paths.metadata_index_path, std::filesystem::path("/home/tester/.local/share/spatialbook/workspace_metadata.json"));
    EXPECT_EQ(paths.workspaces_dir, std::filesystem::path("/home/tester/.local/share/spatialbook/Workspaces"));
}

TEST(PathsResolve, ReturnsNulloptWithoutHome) {
    const spatialbook::EnvConfig env{.home = std::nullopt, .xdg_config_home = "/tmp/xdg", .xdg_data_home = std::nullopt};

    EXPECT_FALSE(spatialbook::try_resolve_paths(env).has_value());
    EXPECT_THROW(spatialbook::resolve_paths(env), std::runtime_error);
}

TEST(PathsResolve, XdgAloneIsEnough) {
    const spatialbook::EnvConfig env{.home = std::nullopt, .xdg_config_home = "/c", .xdg_data_home = "/d"};

    const auto                   paths = spatialbook::try_resolve_paths(env);

    ASSERT_TRUE(paths.has_value());
    EXPECT_EQ(paths->data_dir, std::filesystem::path("/d/spatialbook"));
}
