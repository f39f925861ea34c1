#include "spatialbook/window_registry.hpp"

#include <algorithm>
#include <utility>

#include "spatialbook/logging.hpp"

namespace spatialbook {

    namespace {

        constexpr std::string_view kContext = "registry";

        std::string                window_label(int id) {
            return "window #" + std::to_string(id);
        }

    } // namespace

    WindowRegistry::WindowRegistry(RegistryHooks hooks, RegistryOptions options) : hooks_(std::move(hooks)), options_(std::move(options)) {
        if (!options_.clock) {
            options_.clock = [] { return Clock::now(); };
        }
    }

    WindowRecord WindowRegistry::create(WindowType type, std::optional<int> id, WindowPosition position) {
        WindowRecord record;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            int                         assigned = id.value_or(next_id_locked());
            if (assigned < 0) {
                error_log(kContext, "rejected negative id " + std::to_string(assigned));
                assigned = next_id_locked();
            }
            if (windows_.contains(assigned)) {
                error_log(kContext, window_label(assigned) + " already exists, replacing");
            }
            const auto now             = options_.clock();
            record.id                  = assigned;
            record.type                = type;
            record.position            = position;
            record.created_at          = now;
            record.state.last_modified = now;
            windows_[assigned]         = record;
            high_water_                = std::max(high_water_, assigned);
        }
        debug_log(options_.debug_logging, kContext, "created " + window_label(record.id) + " type=" + std::string(window_type_name(type)));
        notify_changed();
        return record;
    }

    bool WindowRegistry::insert(WindowRecord record) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (record.id < 0 || windows_.contains(record.id)) {
                error_log(kContext, "refused to insert " + window_label(record.id));
                return false;
            }
            high_water_ = std::max(high_water_, record.id);
            const int id = record.id;
            windows_.emplace(id, std::move(record));
        }
        notify_changed();
        return true;
    }

    std::optional<WindowRecord> WindowRegistry::get(int id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = windows_.find(id);
        if (it == windows_.end()) {
            debug_log(options_.debug_logging, kContext, window_label(id) + " not found");
            return std::nullopt;
        }
        if (!open_ids_.contains(id)) {
            debug_log(options_.debug_logging, kContext, window_label(id) + " exists but is not open");
        }
        return it->second;
    }

    template <typename Fn>
    bool WindowRegistry::mutate(int id, std::string_view what, Fn&& fn) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto                  it = windows_.find(id);
            if (it == windows_.end()) {
                debug_log(options_.debug_logging, kContext, "ignored " + std::string(what) + " for unknown " + window_label(id));
                return false;
            }
            fn(it->second);
            it->second.state.last_modified = options_.clock();
        }
        notify_changed();
        return true;
    }

    bool WindowRegistry::update_position(int id, const WindowPosition& position) {
        return mutate(id, "position update", [&](WindowRecord& record) { record.position = position; });
    }

    bool WindowRegistry::update_content(int id, std::string content) {
        return mutate(id, "content update", [&](WindowRecord& record) { record.state.content = std::move(content); });
    }

    bool WindowRegistry::update_template(int id, ExportTemplate value) {
        return mutate(id, "template update", [&](WindowRecord& record) { record.state.export_template = value; });
    }

    bool WindowRegistry::update_appearance(int id, bool minimized, bool maximized, double opacity) {
        return mutate(id, "appearance update", [&](WindowRecord& record) {
            record.state.minimized = minimized;
            record.state.maximized = maximized;
            record.state.opacity   = std::clamp(opacity, 0.0, 1.0);
        });
    }

    bool WindowRegistry::add_tag(int id, std::string_view tag) {
        if (tag.empty()) {
            return false;
        }
        return mutate(id, "tag add", [&](WindowRecord& record) {
            auto& tags = record.state.tags;
            if (std::ranges::find(tags, tag) == tags.end()) {
                tags.emplace_back(tag);
            }
        });
    }

    bool WindowRegistry::remove_tag(int id, std::string_view tag) {
        return mutate(id, "tag removal", [&](WindowRecord& record) { std::erase(record.state.tags, tag); });
    }

    bool WindowRegistry::set_tags(int id, const std::vector<std::string>& tags) {
        return mutate(id, "tag replacement", [&](WindowRecord& record) {
            record.state.tags.clear();
            for (const auto& tag : tags) {
                if (!tag.empty() && std::ranges::find(record.state.tags, tag) == record.state.tags.end()) {
                    record.state.tags.push_back(tag);
                }
            }
        });
    }

    bool WindowRegistry::update_payload(int id, WindowPayload payload) {
        return mutate(id, "payload update", [&](WindowRecord& record) {
            if (record.state.export_template == ExportTemplate::kPlain) {
                if (const auto chosen = auto_template_for(record.type, payload)) {
                    record.state.export_template = *chosen;
                }
            }
            record.state.payload = std::move(payload);
        });
    }

    bool WindowRegistry::update_tabular_data(int id, TabularData data) {
        return update_payload(id, std::move(data));
    }

    bool WindowRegistry::update_chart_data(int id, ChartData data) {
        return update_payload(id, std::move(data));
    }

    bool WindowRegistry::update_point_cloud(int id, PointCloudData data) {
        return update_payload(id, std::move(data));
    }

    bool WindowRegistry::update_volume_metrics(int id, VolumeMetrics data) {
        return update_payload(id, std::move(data));
    }

    bool WindowRegistry::update_model_data(int id, ModelData data) {
        return update_payload(id, std::move(data));
    }

    void WindowRegistry::mark_opened(int id) {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ids_.insert(id);
    }

    void WindowRegistry::mark_closed(int id) {
        std::function<void(int)> cleanup;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ids_.erase(id);
            cleanup = hooks_.cleanup_window;
        }
        if (cleanup) {
            cleanup(id);
        }
    }

    bool WindowRegistry::is_open(int id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_ids_.contains(id);
    }

    std::vector<int> WindowRegistry::open_ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return {open_ids_.begin(), open_ids_.end()};
    }

    void WindowRegistry::remove_window(int id) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            removed = windows_.erase(id) > 0;
        }
        mark_closed(id);
        if (removed) {
            notify_changed();
        }
    }

    std::vector<WindowRecord> WindowRegistry::list_all(bool only_open) const {
        std::vector<WindowRecord> records;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            records.reserve(windows_.size());
            for (const auto& [id, record] : windows_) {
                if (only_open && !open_ids_.contains(id)) {
                    continue;
                }
                records.push_back(record);
            }
        }
        std::ranges::sort(records, {}, &WindowRecord::id);
        return records;
    }

    void WindowRegistry::cleanup_closed() {
        std::vector<int> stale;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, record] : windows_) {
                if (!open_ids_.contains(id)) {
                    stale.push_back(id);
                }
            }
            for (const int id : stale) {
                windows_.erase(id);
            }
        }
        if (stale.empty()) {
            return;
        }
        debug_log(options_.debug_logging, kContext, "purged " + std::to_string(stale.size()) + " closed windows");
        if (hooks_.cleanup_window) {
            for (const int id : stale) {
                hooks_.cleanup_window(id);
            }
        }
        notify_changed();
    }

    void WindowRegistry::clear_all() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            windows_.clear();
            open_ids_.clear();
        }
        if (hooks_.cleanup_all) {
            hooks_.cleanup_all();
        }
        notify_changed();
    }

    int WindowRegistry::next_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return next_id_locked();
    }

    int WindowRegistry::next_id_locked() const {
        int max_id = high_water_;
        for (const auto& [id, record] : windows_) {
            max_id = std::max(max_id, id);
        }
        return max_id + 1;
    }

    size_t WindowRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return windows_.size();
    }

    void WindowRegistry::set_change_listener(std::function<void()> listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        hooks_.on_change = std::move(listener);
    }

    void WindowRegistry::notify_changed() {
        std::function<void()> listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listener = hooks_.on_change;
        }
        if (listener) {
            listener();
        }
    }

} // namespace spatialbook
