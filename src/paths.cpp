#include "spatialbook/paths.hpp"

#include <cstdlib>
#include <stdexcept>

namespace spatialbook {

    namespace {

        std::optional<std::string> get_env(const char* name) {
            if (const char* value = std::getenv(name)) {
                if (*value != '\0') {
                    return std::string(value);
                }
            }
            return std::nullopt;
        }

        EnvConfig env_from_process() {
            return EnvConfig{
                .home            = get_env("HOME"),
                .xdg_config_home = get_env("XDG_CONFIG_HOME"),
                .xdg_data_home   = get_env("XDG_DATA_HOME"),
            };
        }

        std::filesystem::path config_root(const EnvConfig& env) {
            if (env.xdg_config_home) {
                return std::filesystem::path(*env.xdg_config_home);
            }
            if (env.home) {
                return std::filesystem::path(*env.home) / ".config";
            }
            throw std::runtime_error("missing HOME for config root");
        }

        std::filesystem::path data_root(const EnvConfig& env) {
            if (env.xdg_data_home) {
                return std::filesystem::path(*env.xdg_data_home);
            }
            if (env.home) {
                return std::filesystem::path(*env.home) / ".local" / "share";
            }
            throw std::runtime_error("missing HOME for data root");
        }

    } // namespace

    Paths resolve_paths(const EnvConfig& env) {
        const auto config_dir = config_root(env) / "spatialbook";
        const auto data_dir   = data_root(env) / "spatialbook";
        return Paths{
            .config_dir          = config_dir,
            .config_path         = config_dir / "config.json",
            .data_dir            = data_dir,
            .metadata_index_path = data_dir / "workspace_metadata.json",
            .workspaces_dir      = data_dir / "Workspaces",
            .autosave_dir        = data_dir / "autosave",
        };
    }

    Paths resolve_paths_from_env() {
        return resolve_paths(env_from_process());
    }

    std::optional<Paths> try_resolve_paths(const EnvConfig& env) {
        if (!env.home && (!env.xdg_config_home || !env.xdg_data_home)) {
            return std::nullopt;
        }
        return resolve_paths(env);
    }

    std::optional<Paths> try_resolve_paths_from_env() {
        return try_resolve_paths(env_from_process());
    }

} // namespace spatialbook
