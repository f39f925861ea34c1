#include <chrono>

#include <gtest/gtest.h>

#include "spatialbook/save_history.hpp"

namespace {

    spatialbook::SaveResult result_at(int seconds, bool success) {
        return spatialbook::SaveResult{
            .success     = success,
            .destination = spatialbook::SaveDestinationKind::kLocal,
            .error       = success ? "" : "disk full",
            .timestamp   = spatialbook::Timestamp(std::chrono::seconds(seconds)),
            .window_id   = std::nullopt,
            .location    = std::nullopt,
            .event       = spatialbook::AutosaveEventKind::kManualSave,
        };
    }

}

TEST(SaveHistory, KeepsMostRecentTen) {
    spatialbook::SaveHistory history;
    for (int i = 0; i < 15; ++i) {
        history.record(result_at(i, true));
    }

    const auto entries = history.entries();
    ASSERT_EQ(entries.size(), 10u);
    EXPECT_EQ(entries.front().timestamp, spatialbook::Timestamp(std::chrono::seconds(5)));
    EXPECT_EQ(history.last()->timestamp, spatialbook::Timestamp(std::chrono::seconds(14)));
}

TEST(SaveHistory, LastSuccessIgnoresFailures) {
    spatialbook::SaveHistory history;
    EXPECT_FALSE(history.last_success_time().has_value());

    history.record(result_at(3, true));
    history.record(result_at(8, false));

    EXPECT_EQ(history.last_success_time(), spatialbook::Timestamp(std::chrono::seconds(3)));
    EXPECT_FALSE(history.last()->success);
    EXPECT_EQ(history.last()->error, "disk full");
}

TEST(AutosaveEvents, FilterPolicy) {
    const spatialbook::EventFilter everything;
    const spatialbook::EventFilter quiet{.save_on_focus_loss = false, .save_on_movement = false};

    EXPECT_FALSE(spatialbook::should_process(spatialbook::focus_gained(1), everything));
    EXPECT_TRUE(spatialbook::should_process(spatialbook::focus_lost(1), everything));
    EXPECT_FALSE(spatialbook::should_process(spatialbook::focus_lost(1), quiet));
    EXPECT_TRUE(spatialbook::should_process(spatialbook::movement_stopped(1, {}), everything));
    EXPECT_FALSE(spatialbook::should_process(spatialbook::movement_stopped(1, {}), quiet));
    EXPECT_TRUE(spatialbook::should_process(spatialbook::content_changed(1, "x"), quiet));
    EXPECT_TRUE(spatialbook::should_process(spatialbook::window_closed(1), quiet));
    EXPECT_TRUE(spatialbook::should_process(spatialbook::manual_save(), quiet));
    EXPECT_TRUE(spatialbook::should_process(spatialbook::interval_save(), quiet));
}

TEST(AutosaveEvents, Names) {
    EXPECT_EQ(spatialbook::autosave_event_name(spatialbook::AutosaveEventKind::kMovementStopped), "movement-stopped");
    EXPECT_EQ(spatialbook::autosave_event_name(spatialbook::AutosaveEventKind::kIntervalSave), "interval-save");
}
