#ifndef SPATIALBOOK_AUTOSAVE_PIPELINE_HPP
#define SPATIALBOOK_AUTOSAVE_PIPELINE_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "spatialbook/autosave_events.hpp"
#include "spatialbook/config.hpp"
#include "spatialbook/debounce.hpp"
#include "spatialbook/save_destinations.hpp"
#include "spatialbook/save_history.hpp"
#include "spatialbook/time_utils.hpp"

namespace spatialbook {

    struct AutosaveOptions {
        bool                      autosave_enabled   = true;
        EventFilter               filter;
        bool                      save_to_local      = true;
        bool                      save_to_remote     = false;
        std::chrono::milliseconds interval           = std::chrono::seconds(30);
        std::chrono::milliseconds movement_debounce  = std::chrono::milliseconds(1000);
        std::chrono::milliseconds workspace_debounce = std::chrono::milliseconds(1000);
        std::string               workspace_name     = "Untitled";
        bool                      debug_logging      = false;
        ClockSource               clock              = [] { return Clock::now(); };
    };

    AutosaveOptions autosave_options_from(const Config& config);

    enum class PipelineState {
        kIdle,
        kQueuing,
        kDraining,
    };

    // Produces the current document text. Runs on the drain thread.
    using DocumentExporter = std::function<std::string()>;
    // Target of the workspace-level debounce. Runs on the drain thread.
    using WorkspaceSaver = std::function<void()>;

    // Single-consumer autosave queue. Producers never block on I/O; every destination write happens on
    // the drain thread in arrival order.
    class AutosavePipeline {
      public:
        AutosavePipeline(AutosaveOptions options, DocumentExporter exporter, std::vector<std::unique_ptr<SaveDestination>> destinations);
        ~AutosavePipeline();

        AutosavePipeline(const AutosavePipeline&)            = delete;
        AutosavePipeline& operator=(const AutosavePipeline&) = delete;

        void                     start();
        // Flushes pending debounces, drains the queue and joins the drain thread.
        void                     stop();
        bool                     running() const;

        // Events arriving while the drain thread is not running (or is stopping) are dropped.
        void                     enqueue(AutosaveEvent event);
        // Movement samples are debounced per window id; only the last position is emitted.
        void                     window_moved(int window_id, const WindowPosition& position);
        // Every registry mutation lands here; the save fires once the stream pauses.
        void                     schedule_autosave();
        void                     set_workspace_saver(WorkspaceSaver saver);
        void                     set_workspace_name(std::string name);

        // True once the queue is empty and nothing is draining. Pending debounces are not waited for.
        bool                     wait_until_idle(std::chrono::milliseconds timeout);

        PipelineState            state() const;
        std::vector<SaveResult>  results() const;
        std::optional<Timestamp> last_save_time() const;
        size_t                   processed_count() const;
        size_t                   queued_count() const;

      private:
        struct Job {
            std::optional<AutosaveEvent> event;
            bool                         workspace_save = false;
        };

        void                                          run();
        void                                          collect_due_locked(SteadyTime now);
        std::optional<SteadyTime>                     next_wake_locked() const;
        void                                          process(const Job& job);
        void                                          save_to_destinations(const AutosaveEvent& event);
        bool                                          destination_enabled(const SaveDestination& destination) const;

        AutosaveOptions                               options_;
        DocumentExporter                              exporter_;
        std::vector<std::unique_ptr<SaveDestination>> destinations_;
        WorkspaceSaver                                workspace_saver_;

        mutable std::mutex                            mutex_;
        std::condition_variable                       cv_;
        std::condition_variable                       idle_cv_;
        std::deque<Job>                               queue_;
        KeyedDebounce<int, WindowPosition>            movement_;
        PendingDebounce                               workspace_debounce_;
        std::optional<SteadyTime>                     next_interval_;
        PipelineState                                 state_     = PipelineState::kIdle;
        bool                                          running_   = false;
        bool                                          stopping_  = false;
        size_t                                        processed_ = 0;
        SaveHistory                                   history_;
        std::thread                                   thread_;
    };

} // namespace spatialbook

#endif // SPATIALBOOK_AUTOSAVE_PIPELINE_HPP
