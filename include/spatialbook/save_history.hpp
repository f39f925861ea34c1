#ifndef SPATIALBOOK_SAVE_HISTORY_HPP
#define SPATIALBOOK_SAVE_HISTORY_HPP

#include <cstddef>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "spatialbook/autosave_events.hpp"
#include "spatialbook/config.hpp"
#include "spatialbook/time_utils.hpp"

namespace spatialbook {

    struct SaveResult {
        bool                                 success = false;
        SaveDestinationKind                  destination;
        std::string                          error;
        Timestamp                            timestamp;
        std::optional<int>                   window_id;
        std::optional<std::filesystem::path> location;
        AutosaveEventKind                    event;
    };

    inline constexpr size_t kSaveHistoryCapacity = 10;

    // Bounded, oldest-first record of destination outcomes. Not synchronized.
    class SaveHistory {
      public:
        explicit SaveHistory(size_t capacity = kSaveHistoryCapacity);

        void                      record(SaveResult result);
        std::vector<SaveResult>   entries() const;
        std::optional<SaveResult> last() const;
        std::optional<Timestamp>  last_success_time() const;
        size_t                    size() const;

      private:
        size_t                   capacity_;
        std::deque<SaveResult>   entries_;
        std::optional<Timestamp> last_success_;
    };

} // namespace spatialbook

#endif // SPATIALBOOK_SAVE_HISTORY_HPP
