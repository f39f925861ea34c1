#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "spatialbook/logging.hpp"
#include "spatialbook/runtime.hpp"

namespace {

    constexpr const char* kUsage = "usage: spatialbook <list [templates|custom] | search <query> | show <name> | refresh |\n"
                                   "                    create <name> [--from <document>] [--description <text>] [--category <category>] [--template] |\n"
                                   "                    delete <name> | duplicate <name> | inspect <document>>";

    std::optional<spatialbook::RuntimeConfig> load_runtime_config() {
        const auto paths = spatialbook::try_resolve_paths_from_env();
        if (!paths) {
            spatialbook::error_log("startup", "HOME is not set and XDG directories are incomplete");
            return std::nullopt;
        }
        std::string error;
        const auto  overrides = spatialbook::load_config_overrides(paths->config_path, &error);
        if (!overrides) {
            spatialbook::error_log("config", error);
            return std::nullopt;
        }
        return spatialbook::RuntimeConfig{.paths = *paths, .config = spatialbook::apply_overrides(spatialbook::Config{}, *overrides)};
    }

}

int main(int argc, char** argv) {
    spatialbook::set_error_log_sink(spatialbook::stderr_log_sink);

    const std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args.front() == "--help" || args.front() == "-h") {
        std::cout << kUsage << '\n';
        return args.empty() ? 1 : 0;
    }

    const auto runtime = load_runtime_config();
    if (!runtime) {
        return 1;
    }
    if (runtime->config.debug_logging) {
        spatialbook::set_debug_log_sink(spatialbook::stderr_log_sink);
    }

    const spatialbook::NotebookCodec    codec(spatialbook::CodecOptions{.debug_logging = runtime->config.debug_logging});
    spatialbook::WorkspaceMetadataStore store(
        spatialbook::WorkspaceStoreOptions{
            .index_path     = runtime->paths.metadata_index_path,
            .workspaces_dir = runtime->paths.workspaces_dir,
            .open_delay     = runtime->config.window_open_delay,
            .debug_logging  = runtime->config.debug_logging,
        },
        codec);
    store.load();

    const auto result = spatialbook::run_command_line(store, codec, args);
    if (!result.success) {
        std::cerr << result.output << '\n';
        return 1;
    }
    if (!result.output.empty()) {
        std::cout << result.output << '\n';
    }
    return 0;
}
