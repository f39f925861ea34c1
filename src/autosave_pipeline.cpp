#include "spatialbook/autosave_pipeline.hpp"

#include <utility>

#include "spatialbook/failsafe.hpp"
#include "spatialbook/logging.hpp"

namespace spatialbook {

    namespace {

        constexpr std::string_view kContext = "autosave";

    } // namespace

    AutosaveOptions autosave_options_from(const Config& config) {
        return AutosaveOptions{
            .autosave_enabled   = config.autosave_enabled,
            .filter             = EventFilter{.save_on_focus_loss = config.save_on_focus_loss, .save_on_movement = config.save_on_movement},
            .save_to_local      = config.save_to_local,
            .save_to_remote     = config.save_to_remote,
            .interval           = config.autosave_interval,
            .movement_debounce  = config.movement_debounce,
            .workspace_debounce = config.workspace_debounce,
            .workspace_name     = "Untitled",
            .debug_logging      = config.debug_logging,
        };
    }

    AutosavePipeline::AutosavePipeline(AutosaveOptions options, DocumentExporter exporter, std::vector<std::unique_ptr<SaveDestination>> destinations) :
        options_(std::move(options)), exporter_(std::move(exporter)), destinations_(std::move(destinations)), movement_(options_.movement_debounce),
        workspace_debounce_(options_.workspace_debounce) {
        if (!options_.clock) {
            options_.clock = [] { return Clock::now(); };
        }
    }

    AutosavePipeline::~AutosavePipeline() {
        stop();
    }

    void AutosavePipeline::start() {
        std::lock_guard lock(mutex_);
        if (running_) {
            return;
        }
        running_  = true;
        stopping_ = false;
        if (options_.interval > std::chrono::milliseconds::zero()) {
            next_interval_ = SteadyClock::now() + options_.interval;
        }
        thread_ = std::thread(&AutosavePipeline::run, this);
        debug_log(options_.debug_logging, kContext, "pipeline started");
    }

    void AutosavePipeline::stop() {
        {
            std::lock_guard lock(mutex_);
            if (!running_) {
                return;
            }
            stopping_ = true;
            for (auto& [window_id, position] : movement_.flush_all()) {
                queue_.push_back(Job{.event = movement_stopped(window_id, position)});
            }
            if (workspace_debounce_.pending()) {
                workspace_debounce_.cancel();
                queue_.push_back(Job{.workspace_save = true});
            }
            next_interval_.reset();
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        std::lock_guard lock(mutex_);
        running_ = false;
        state_   = PipelineState::kIdle;
        idle_cv_.notify_all();
        debug_log(options_.debug_logging, kContext, "pipeline stopped");
    }

    bool AutosavePipeline::running() const {
        std::lock_guard lock(mutex_);
        return running_;
    }

    void AutosavePipeline::enqueue(AutosaveEvent event) {
        if (!options_.autosave_enabled && event.kind != AutosaveEventKind::kManualSave) {
            debug_log(options_.debug_logging, kContext, "autosave disabled, dropping " + std::string(autosave_event_name(event.kind)));
            return;
        }
        {
            std::lock_guard lock(mutex_);
            if (!running_ || stopping_) {
                debug_log(options_.debug_logging, kContext, "pipeline not running, dropping " + std::string(autosave_event_name(event.kind)));
                return;
            }
            queue_.push_back(Job{.event = std::move(event)});
            if (state_ == PipelineState::kIdle) {
                state_ = PipelineState::kQueuing;
            }
        }
        cv_.notify_one();
    }

    void AutosavePipeline::window_moved(int window_id, const WindowPosition& position) {
        if (!options_.autosave_enabled) {
            return;
        }
        {
            std::lock_guard lock(mutex_);
            movement_.record(window_id, position, SteadyClock::now());
        }
        cv_.notify_one();
    }

    void AutosavePipeline::schedule_autosave() {
        if (!options_.autosave_enabled) {
            return;
        }
        {
            std::lock_guard lock(mutex_);
            workspace_debounce_.mark(SteadyClock::now());
        }
        cv_.notify_one();
    }

    void AutosavePipeline::set_workspace_saver(WorkspaceSaver saver) {
        std::lock_guard lock(mutex_);
        workspace_saver_ = std::move(saver);
    }

    void AutosavePipeline::set_workspace_name(std::string name) {
        std::lock_guard lock(mutex_);
        options_.workspace_name = std::move(name);
    }

    bool AutosavePipeline::wait_until_idle(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return idle_cv_.wait_for(lock, timeout, [&] { return queue_.empty() && state_ != PipelineState::kDraining; });
    }

    PipelineState AutosavePipeline::state() const {
        std::lock_guard lock(mutex_);
        return state_;
    }

    std::vector<SaveResult> AutosavePipeline::results() const {
        std::lock_guard lock(mutex_);
        return history_.entries();
    }

    std::optional<Timestamp> AutosavePipeline::last_save_time() const {
        std::lock_guard lock(mutex_);
        return history_.last_success_time();
    }

    size_t AutosavePipeline::processed_count() const {
        std::lock_guard lock(mutex_);
        return processed_;
    }

    size_t AutosavePipeline::queued_count() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    void AutosavePipeline::run() {
        std::unique_lock lock(mutex_);
        while (true) {
            collect_due_locked(SteadyClock::now());
            if (!queue_.empty()) {
                Job job = std::move(queue_.front());
                queue_.pop_front();
                state_ = PipelineState::kDraining;
                lock.unlock();
                process(job);
                lock.lock();
                ++processed_;
                continue;
            }
            state_ = PipelineState::kIdle;
            idle_cv_.notify_all();
            if (stopping_) {
                break;
            }
            if (const auto wake = next_wake_locked()) {
                cv_.wait_until(lock, *wake);
            } else {
                cv_.wait(lock);
            }
        }
    }

    void AutosavePipeline::collect_due_locked(SteadyTime now) {
        for (auto& [window_id, position] : movement_.flush(now)) {
            queue_.push_back(Job{.event = movement_stopped(window_id, position)});
        }
        if (workspace_debounce_.flush(now)) {
            queue_.push_back(Job{.workspace_save = true});
        }
        if (next_interval_ && now >= *next_interval_) {
            queue_.push_back(Job{.event = interval_save()});
            next_interval_ = now + options_.interval;
        }
    }

    std::optional<SteadyTime> AutosavePipeline::next_wake_locked() const {
        std::optional<SteadyTime> wake = movement_.next_deadline();
        for (const auto& candidate : {workspace_debounce_.deadline(), next_interval_}) {
            if (candidate && (!wake || *candidate < *wake)) {
                wake = candidate;
            }
        }
        return wake;
    }

    void AutosavePipeline::process(const Job& job) {
        if (job.workspace_save) {
            WorkspaceSaver saver;
            {
                std::lock_guard lock(mutex_);
                saver = workspace_saver_;
            }
            if (!saver) {
                save_to_destinations(AutosaveEvent{.kind = AutosaveEventKind::kContentChanged});
                return;
            }
            const bool saved = failsafe::guard(saver, [](std::string_view context, std::string_view message) { error_log(context, message); }, kContext);
            debug_log(options_.debug_logging, kContext, saved ? "workspace saved" : "workspace save failed");
            return;
        }
        if (!job.event) {
            return;
        }
        if (!should_process(*job.event, options_.filter)) {
            debug_log(options_.debug_logging, kContext, "ignoring " + std::string(autosave_event_name(job.event->kind)));
            return;
        }
        save_to_destinations(*job.event);
    }

    bool AutosavePipeline::destination_enabled(const SaveDestination& destination) const {
        switch (destination.kind()) {
            case SaveDestinationKind::kLocal: return options_.save_to_local;
            case SaveDestinationKind::kRemote: return options_.save_to_remote;
        }
        return false;
    }

    void AutosavePipeline::save_to_destinations(const AutosaveEvent& event) {
        std::string                document;
        std::optional<std::string> export_failure;
        if (!exporter_) {
            export_failure = "no document exporter";
        } else {
            export_failure = failsafe::capture([&] { document = exporter_(); });
        }

        std::string workspace;
        {
            std::lock_guard lock(mutex_);
            workspace = options_.workspace_name;
        }

        bool attempted = false;
        for (const auto& destination : destinations_) {
            if (!destination || !destination_enabled(*destination)) {
                continue;
            }
            attempted = true;
            SaveResult result{
                .success     = false,
                .destination = destination->kind(),
                .error       = {},
                .timestamp   = options_.clock(),
                .window_id   = event.window_id,
                .location    = std::nullopt,
                .event       = event.kind,
            };
            if (export_failure) {
                result.error = "export failed: " + *export_failure;
            } else {
                DestinationResult written = std::unexpected(std::string("destination did not run"));
                if (const auto thrown = failsafe::capture([&] { written = destination->write(workspace, document); })) {
                    result.error = *thrown;
                } else if (!written) {
                    result.error = written.error();
                } else {
                    result.success  = true;
                    result.location = *written;
                }
            }

            const std::string label = std::string(save_destination_name(result.destination)) + " save for " + std::string(autosave_event_name(event.kind));
            if (result.success) {
                debug_log(options_.debug_logging, kContext, label + " succeeded");
            } else {
                error_log(kContext, label + " failed: " + result.error);
            }
            std::lock_guard lock(mutex_);
            history_.record(std::move(result));
        }
        if (!attempted) {
            debug_log(options_.debug_logging, kContext, "no save destination enabled");
        }
    }

} // namespace spatialbook
