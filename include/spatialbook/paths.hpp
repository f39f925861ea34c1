#ifndef SPATIALBOOK_PATHS_HPP
#define SPATIALBOOK_PATHS_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace spatialbook {

    struct EnvConfig {
        std::optional<std::string> home;
        std::optional<std::string> xdg_config_home;
        std::optional<std::string> xdg_data_home;
    };

    struct Paths {
        std::filesystem::path config_dir;
        std::filesystem::path config_path;
        std::filesystem::path data_dir;
        std::filesystem::path metadata_index_path;
        std::filesystem::path workspaces_dir;
        std::filesystem::path autosave_dir;
    };

    Paths                resolve_paths(const EnvConfig& env);
    Paths                resolve_paths_from_env();
    std::optional<Paths> try_resolve_paths(const EnvConfig& env);
    std::optional<Paths> try_resolve_paths_from_env();
} // namespace spatialbook

#endif // SPATIALBOOK_PATHS_HPP
