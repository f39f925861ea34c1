#include "spatialbook/config.hpp"

#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "spatialbook/file_io.hpp"
#include "spatialbook/strings.hpp"

namespace spatialbook {

    namespace {

        bool set_error(std::string* error, std::string message) {
            if (error) {
                *error = std::move(message);
            }
            return false;
        }

        bool read_bool(const nlohmann::json& root, const char* key, std::optional<bool>& out, std::string* error) {
            if (!root.contains(key)) {
                return true;
            }
            if (!root.at(key).is_boolean()) {
                return set_error(error, std::string(key) + " must be a boolean");
            }
            out = root.at(key).get<bool>();
            return true;
        }

        template <typename Duration>
        bool read_duration(const nlohmann::json& root, const char* key, std::optional<Duration>& out, std::string* error) {
            if (!root.contains(key)) {
                return true;
            }
            const auto& value = root.at(key);
            if (!value.is_number_integer() || value.get<long long>() < 0) {
                return set_error(error, std::string(key) + " must be a non-negative integer");
            }
            out = Duration(value.get<long long>());
            return true;
        }

        bool read_destinations(const nlohmann::json& root, ConfigOverrides& overrides, std::string* error) {
            if (!root.contains("destinations")) {
                return true;
            }
            const auto& value = root.at("destinations");
            if (!value.is_array() || value.empty()) {
                return set_error(error, "destinations must be a non-empty array");
            }
            bool local  = false;
            bool remote = false;
            for (const auto& entry : value) {
                const auto kind = entry.is_string() ? parse_save_destination(entry.get<std::string>()) : std::nullopt;
                if (!kind) {
                    return set_error(error, "unknown save destination: " + entry.dump());
                }
                switch (*kind) {
                    case SaveDestinationKind::kLocal: local = true; break;
                    case SaveDestinationKind::kRemote: remote = true; break;
                }
            }
            overrides.save_to_local  = local;
            overrides.save_to_remote = remote;
            return true;
        }

    } // namespace

    std::string_view save_destination_name(SaveDestinationKind kind) {
        switch (kind) {
            case SaveDestinationKind::kLocal: return "local";
            case SaveDestinationKind::kRemote: return "remote";
        }
        return "local";
    }

    std::optional<SaveDestinationKind> parse_save_destination(std::string_view value) {
        const auto normalized = to_lower_copy(trim_view(value));
        if (normalized == "local") {
            return SaveDestinationKind::kLocal;
        }
        if (normalized == "remote") {
            return SaveDestinationKind::kRemote;
        }
        return std::nullopt;
    }

    Config apply_overrides(const Config& base, const ConfigOverrides& overrides) {
        Config merged = base;
        if (overrides.autosave_enabled) {
            merged.autosave_enabled = *overrides.autosave_enabled;
        }
        if (overrides.save_on_focus_loss) {
            merged.save_on_focus_loss = *overrides.save_on_focus_loss;
        }
        if (overrides.save_on_movement) {
            merged.save_on_movement = *overrides.save_on_movement;
        }
        if (overrides.save_to_local) {
            merged.save_to_local = *overrides.save_to_local;
        }
        if (overrides.save_to_remote) {
            merged.save_to_remote = *overrides.save_to_remote;
        }
        if (overrides.autosave_interval) {
            merged.autosave_interval = *overrides.autosave_interval;
        }
        if (overrides.movement_debounce) {
            merged.movement_debounce = *overrides.movement_debounce;
        }
        if (overrides.workspace_debounce) {
            merged.workspace_debounce = *overrides.workspace_debounce;
        }
        if (overrides.remote_timeout) {
            merged.remote_timeout = *overrides.remote_timeout;
        }
        if (overrides.remote_server_url) {
            merged.remote_server_url = *overrides.remote_server_url;
        }
        if (overrides.window_open_delay) {
            merged.window_open_delay = *overrides.window_open_delay;
        }
        if (overrides.debug_logging) {
            merged.debug_logging = *overrides.debug_logging;
        }
        return merged;
    }

    std::optional<std::string> normalize_override_string(std::string_view value) {
        const auto trimmed = trim_copy(value);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        return trimmed;
    }

    std::optional<ConfigOverrides> load_config_overrides(const std::filesystem::path& path, std::string* error) {
        if (error) {
            error->clear();
        }
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return ConfigOverrides{};
        }
        const auto text = read_text_file(path);
        if (!text) {
            set_error(error, "unable to read " + path.string());
            return std::nullopt;
        }
        const auto root = nlohmann::json::parse(*text, nullptr, false);
        if (root.is_discarded() || !root.is_object()) {
            set_error(error, "settings file is not a JSON object");
            return std::nullopt;
        }

        ConfigOverrides overrides;
        if (!read_bool(root, "autosave_enabled", overrides.autosave_enabled, error) ||
            !read_bool(root, "save_on_focus_loss", overrides.save_on_focus_loss, error) ||
            !read_bool(root, "save_on_movement", overrides.save_on_movement, error) ||
            !read_bool(root, "save_to_local", overrides.save_to_local, error) ||
            !read_bool(root, "save_to_remote", overrides.save_to_remote, error) || !read_bool(root, "debug_logging", overrides.debug_logging, error) ||
            !read_duration(root, "autosave_interval_seconds", overrides.autosave_interval, error) ||
            !read_duration(root, "movement_debounce_ms", overrides.movement_debounce, error) ||
            !read_duration(root, "workspace_debounce_ms", overrides.workspace_debounce, error) ||
            !read_duration(root, "remote_timeout_seconds", overrides.remote_timeout, error) ||
            !read_duration(root, "window_open_delay_ms", overrides.window_open_delay, error) || !read_destinations(root, overrides, error)) {
            return std::nullopt;
        }
        if (root.contains("remote_server_url")) {
            if (!root.at("remote_server_url").is_string()) {
                set_error(error, "remote_server_url must be a string");
                return std::nullopt;
            }
            overrides.remote_server_url = normalize_override_string(root.at("remote_server_url").get<std::string>());
        }
        return overrides;
    }

} // namespace spatialbook
