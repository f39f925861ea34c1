#ifndef SPATIALBOOK_WINDOW_REGISTRY_HPP
#define SPATIALBOOK_WINDOW_REGISTRY_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "spatialbook/time_utils.hpp"
#include "spatialbook/types.hpp"

namespace spatialbook {

    // Rendering-side collaborators. Invoked outside the registry lock.
    struct RegistryHooks {
        std::function<void(int)> cleanup_window;
        std::function<void()>    cleanup_all;
        std::function<void()>    on_change;
    };

    struct RegistryOptions {
        bool        debug_logging = false;
        ClockSource clock         = [] { return Clock::now(); };
    };

    class WindowRegistry {
      public:
        explicit WindowRegistry(RegistryHooks hooks = {}, RegistryOptions options = {});

        WindowRegistry(const WindowRegistry&)            = delete;
        WindowRegistry& operator=(const WindowRegistry&) = delete;

        WindowRecord                create(WindowType type, std::optional<int> id = std::nullopt, WindowPosition position = {});
        // Inserts a fully built record, e.g. one restored from a document. Returns false on id collision.
        bool                        insert(WindowRecord record);
        std::optional<WindowRecord> get(int id) const;

        // Mutators return false (and log) when the id is unknown.
        bool                        update_position(int id, const WindowPosition& position);
        bool                        update_content(int id, std::string content);
        bool                        update_template(int id, ExportTemplate value);
        bool                        update_appearance(int id, bool minimized, bool maximized, double opacity);
        bool                        add_tag(int id, std::string_view tag);
        bool                        remove_tag(int id, std::string_view tag);
        bool                        set_tags(int id, const std::vector<std::string>& tags);
        bool                        update_tabular_data(int id, TabularData data);
        bool                        update_chart_data(int id, ChartData data);
        bool                        update_point_cloud(int id, PointCloudData data);
        bool                        update_volume_metrics(int id, VolumeMetrics data);
        bool                        update_model_data(int id, ModelData data);

        void                        mark_opened(int id);
        void                        mark_closed(int id);
        bool                        is_open(int id) const;
        std::vector<int>            open_ids() const;

        void                        remove_window(int id);
        std::vector<WindowRecord>   list_all(bool only_open = false) const;
        void                        cleanup_closed();
        void                        clear_all();

        // Never hands out an id that was used before, even after removal.
        int                         next_id() const;
        size_t                      size() const;

        void                        set_change_listener(std::function<void()> listener);

      private:
        template <typename Fn>
        bool                                   mutate(int id, std::string_view what, Fn&& fn);
        bool                                   update_payload(int id, WindowPayload payload);
        int                                    next_id_locked() const;
        void                                   notify_changed();

        RegistryHooks                          hooks_;
        RegistryOptions                        options_;
        mutable std::mutex                     mutex_;
        std::unordered_map<int, WindowRecord>  windows_;
        std::set<int>                          open_ids_;
        int                                    high_water_ = 0;
    };

} // namespace spatialbook

#endif // SPATIALBOOK_WINDOW_REGISTRY_HPP
