#ifndef SPATIALBOOK_CONFIG_HPP
#define SPATIALBOOK_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace spatialbook {

    enum class SaveDestinationKind {
        kLocal,
        kRemote,
    };

    std::string_view                   save_destination_name(SaveDestinationKind kind);
    std::optional<SaveDestinationKind> parse_save_destination(std::string_view value);

    struct Config {
        bool                      autosave_enabled   = true;
        bool                      save_on_focus_loss = true;
        bool                      save_on_movement   = true;
        bool                      save_to_local      = true;
        bool                      save_to_remote     = false;
        // Zero disables the periodic interval save.
        std::chrono::seconds      autosave_interval  = std::chrono::seconds(30);
        std::chrono::milliseconds movement_debounce  = std::chrono::milliseconds(1000);
        std::chrono::milliseconds workspace_debounce = std::chrono::milliseconds(1000);
        std::chrono::seconds      remote_timeout     = std::chrono::seconds(10);
        std::string               remote_server_url  = "http://localhost:8888";
        std::chrono::milliseconds window_open_delay  = std::chrono::milliseconds(200);
        bool                      debug_logging      = false;
    };

    struct ConfigOverrides {
        std::optional<bool>                      autosave_enabled;
        std::optional<bool>                      save_on_focus_loss;
        std::optional<bool>                      save_on_movement;
        std::optional<bool>                      save_to_local;
        std::optional<bool>                      save_to_remote;
        std::optional<std::chrono::seconds>      autosave_interval;
        std::optional<std::chrono::milliseconds> movement_debounce;
        std::optional<std::chrono::milliseconds> workspace_debounce;
        std::optional<std::chrono::seconds>      remote_timeout;
        std::optional<std::string>               remote_server_url;
        std::optional<std::chrono::milliseconds> window_open_delay;
        std::optional<bool>                      debug_logging;
    };

    Config                         apply_overrides(const Config& base, const ConfigOverrides& overrides);
    std::optional<std::string>     normalize_override_string(std::string_view value);

    // Absent file yields empty overrides. Malformed JSON or a wrong-typed key sets error.
    std::optional<ConfigOverrides> load_config_overrides(const std::filesystem::path& path, std::string* error);

} // namespace spatialbook

#endif // SPATIALBOOK_CONFIG_HPP
