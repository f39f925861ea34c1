#ifndef SPATIALBOOK_AUTOSAVE_EVENTS_HPP
#define SPATIALBOOK_AUTOSAVE_EVENTS_HPP

#include <optional>
#include <string>
#include <string_view>

#include "spatialbook/types.hpp"

namespace spatialbook {

    enum class AutosaveEventKind {
        kFocusGained,
        kFocusLost,
        kMovementStopped,
        kContentChanged,
        kWindowClosed,
        kManualSave,
        kIntervalSave,
    };

    struct AutosaveEvent {
        AutosaveEventKind             kind;
        std::optional<int>            window_id = std::nullopt;
        std::optional<WindowPosition> position  = std::nullopt;
        std::optional<std::string>    content   = std::nullopt;
    };

    struct EventFilter {
        bool save_on_focus_loss = true;
        bool save_on_movement   = true;
    };

    std::string_view autosave_event_name(AutosaveEventKind kind);

    AutosaveEvent    focus_gained(int window_id);
    AutosaveEvent    focus_lost(int window_id);
    AutosaveEvent    movement_stopped(int window_id, const WindowPosition& position);
    AutosaveEvent    content_changed(int window_id, std::string content);
    AutosaveEvent    window_closed(int window_id);
    AutosaveEvent    manual_save();
    AutosaveEvent    interval_save();

    // Focus gained only feeds tracking state and is never saved.
    bool             should_process(const AutosaveEvent& event, const EventFilter& filter);

} // namespace spatialbook

#endif // SPATIALBOOK_AUTOSAVE_EVENTS_HPP
