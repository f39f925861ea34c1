#include "spatialbook/debounce.hpp"

namespace spatialbook {

    PendingDebounce::PendingDebounce(std::chrono::milliseconds min_interval) : min_interval_(min_interval), pending_(false) {}

    void PendingDebounce::mark(SteadyTime now) {
        last_event_ = now;
        pending_    = true;
    }

    bool PendingDebounce::flush(SteadyTime now) {
        if (!pending_) {
            return false;
        }
        if (!last_event_) {
            return false;
        }
        if (now - *last_event_ < min_interval_) {
            return false;
        }
        pending_ = false;
        return true;
    }

    void PendingDebounce::cancel() {
        pending_ = false;
    }

    bool PendingDebounce::pending() const {
        return pending_;
    }

    std::optional<SteadyTime> PendingDebounce::deadline() const {
        if (!pending_ || !last_event_) {
            return std::nullopt;
        }
        return *last_event_ + min_interval_;
    }

} // namespace spatialbook
