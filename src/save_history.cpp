#include "spatialbook/save_history.hpp"

#include <utility>

namespace spatialbook {

    SaveHistory::SaveHistory(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    void SaveHistory::record(SaveResult result) {
        if (result.success && (!last_success_ || *last_success_ < result.timestamp)) {
            last_success_ = result.timestamp;
        }
        entries_.push_back(std::move(result));
        while (entries_.size() > capacity_) {
            entries_.pop_front();
        }
    }

    std::vector<SaveResult> SaveHistory::entries() const {
        return {entries_.begin(), entries_.end()};
    }

    std::optional<SaveResult> SaveHistory::last() const {
        if (entries_.empty()) {
            return std::nullopt;
        }
        return entries_.back();
    }

    std::optional<Timestamp> SaveHistory::last_success_time() const {
        return last_success_;
    }

    size_t SaveHistory::size() const {
        return entries_.size();
    }

} // namespace spatialbook
