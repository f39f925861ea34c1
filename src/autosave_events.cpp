#include "spatialbook/autosave_events.hpp"

#include <utility>

namespace spatialbook {

    std::string_view autosave_event_name(AutosaveEventKind kind) {
        switch (kind) {
            case AutosaveEventKind::kFocusGained: return "focus-gained";
            case AutosaveEventKind::kFocusLost: return "focus-lost";
            case AutosaveEventKind::kMovementStopped: return "movement-stopped";
            case AutosaveEventKind::kContentChanged: return "content-changed";
            case AutosaveEventKind::kWindowClosed: return "window-closed";
            case AutosaveEventKind::kManualSave: return "manual-save";
            case AutosaveEventKind::kIntervalSave: return "interval-save";
        }
        return "unknown";
    }

    AutosaveEvent focus_gained(int window_id) {
        return AutosaveEvent{.kind = AutosaveEventKind::kFocusGained, .window_id = window_id};
    }

    AutosaveEvent focus_lost(int window_id) {
        return AutosaveEvent{.kind = AutosaveEventKind::kFocusLost, .window_id = window_id};
    }

    AutosaveEvent movement_stopped(int window_id, const WindowPosition& position) {
        return AutosaveEvent{.kind = AutosaveEventKind::kMovementStopped, .window_id = window_id, .position = position};
    }

    AutosaveEvent content_changed(int window_id, std::string content) {
        return AutosaveEvent{.kind = AutosaveEventKind::kContentChanged, .window_id = window_id, .content = std::move(content)};
    }

    AutosaveEvent window_closed(int window_id) {
        return AutosaveEvent{.kind = AutosaveEventKind::kWindowClosed, .window_id = window_id};
    }

    AutosaveEvent manual_save() {
        return AutosaveEvent{.kind = AutosaveEventKind::kManualSave};
    }

    AutosaveEvent interval_save() {
        return AutosaveEvent{.kind = AutosaveEventKind::kIntervalSave};
    }

    bool should_process(const AutosaveEvent& event, const EventFilter& filter) {
        switch (event.kind) {
            case AutosaveEventKind::kFocusGained: return false;
            case AutosaveEventKind::kFocusLost: return filter.save_on_focus_loss;
            case AutosaveEventKind::kMovementStopped: return filter.save_on_movement;
            case AutosaveEventKind::kContentChanged:
            case AutosaveEventKind::kWindowClosed:
            case AutosaveEventKind::kManualSave:
            case AutosaveEventKind::kIntervalSave: return true;
        }
        return false;
    }

} // namespace spatialbook
