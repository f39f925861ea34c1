#include <stdexcept>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "spatialbook/failsafe.hpp"

TEST(FailsafeCapture, ReturnsNothingWhenSaveSucceeds) {
    int        writes  = 0;
    const auto failure = spatialbook::failsafe::capture([&] { ++writes; });

    EXPECT_FALSE(failure.has_value());
    EXPECT_EQ(writes, 1);
}

TEST(FailsafeCapture, ReportsExceptionText) {
    const auto failure = spatialbook::failsafe::capture([] { throw std::runtime_error("disk full"); });

    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(*failure, "disk full");
}

TEST(FailsafeCapture, ReportsNonStandardThrow) {
    const auto failure = spatialbook::failsafe::capture([] { throw 42; });

    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(*failure, "unknown exception");
}

TEST(FailsafeGuard, PassesContextToHandler) {
    std::string context;
    std::string message;
    const auto  ok = spatialbook::failsafe::guard([] { throw std::invalid_argument("cell source is not text"); },
                                                 [&](std::string_view where, std::string_view what) {
                                                     context = std::string(where);
                                                     message = std::string(what);
                                                 },
                                                 "restore cell");

    EXPECT_FALSE(ok);
    EXPECT_EQ(context, "restore cell");
    EXPECT_EQ(message, "cell source is not text");
}

TEST(FailsafeGuard, HandlerFailureStillReportsFalse) {
    bool       handler_ran = false;
    const auto ok          = spatialbook::failsafe::guard([] { throw std::runtime_error("export failed"); },
                                                 [&](std::string_view, std::string_view) {
                                                     handler_ran = true;
                                                     throw std::logic_error("log sink closed");
                                                 },
                                                 "autosave");

    EXPECT_FALSE(ok);
    EXPECT_TRUE(handler_ran);
    EXPECT_TRUE(spatialbook::failsafe::guard([] {}, [](std::string_view, std::string_view) {}, "noop"));
}
