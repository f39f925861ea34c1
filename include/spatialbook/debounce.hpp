#ifndef SPATIALBOOK_DEBOUNCE_HPP
#define SPATIALBOOK_DEBOUNCE_HPP

#include <chrono>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace spatialbook {

    using SteadyClock = std::chrono::steady_clock;
    using SteadyTime  = SteadyClock::time_point;

    // Trailing-edge debounce for a single key: fires once after min_interval of quiet.
    class PendingDebounce {
      public:
        explicit PendingDebounce(std::chrono::milliseconds min_interval);

        void                      mark(SteadyTime now);
        bool                      flush(SteadyTime now);
        void                      cancel();
        bool                      pending() const;
        std::optional<SteadyTime> deadline() const;

      private:
        std::chrono::milliseconds min_interval_;
        std::optional<SteadyTime> last_event_;
        bool                      pending_;
    };

    // Per-key trailing-edge debounce. Each record replaces the key's value and restarts its window,
    // so a superseded value can never be emitted.
    template <typename Key, typename Value>
    class KeyedDebounce {
      public:
        explicit KeyedDebounce(std::chrono::milliseconds min_interval) : min_interval_(min_interval) {}

        void record(const Key& key, Value value, SteadyTime now) {
            entries_.insert_or_assign(key, Entry{.value = std::move(value), .last_event = now});
        }

        // Removes and returns every entry that has been quiet for at least min_interval.
        std::vector<std::pair<Key, Value>> flush(SteadyTime now) {
            std::vector<std::pair<Key, Value>> due;
            for (auto it = entries_.begin(); it != entries_.end();) {
                if (now - it->second.last_event < min_interval_) {
                    ++it;
                    continue;
                }
                due.emplace_back(it->first, std::move(it->second.value));
                it = entries_.erase(it);
            }
            return due;
        }

        // Returns every entry regardless of its deadline.
        std::vector<std::pair<Key, Value>> flush_all() {
            std::vector<std::pair<Key, Value>> due;
            due.reserve(entries_.size());
            for (auto& [key, entry] : entries_) {
                due.emplace_back(key, std::move(entry.value));
            }
            entries_.clear();
            return due;
        }

        std::optional<SteadyTime> next_deadline() const {
            std::optional<SteadyTime> earliest;
            for (const auto& [key, entry] : entries_) {
                const auto deadline = entry.last_event + min_interval_;
                if (!earliest || deadline < *earliest) {
                    earliest = deadline;
                }
            }
            return earliest;
        }

        bool cancel(const Key& key) {
            return entries_.erase(key) > 0;
        }

        size_t size() const {
            return entries_.size();
        }

      private:
        struct Entry {
            Value      value;
            SteadyTime last_event;
        };

        std::chrono::milliseconds min_interval_;
        std::map<Key, Entry>      entries_;
    };

} // namespace spatialbook

#endif // SPATIALBOOK_DEBOUNCE_HPP
