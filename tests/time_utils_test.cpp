#include <chrono>

#include <gtest/gtest.h>

#include "spatialbook/time_utils.hpp"
#include "spatialbook/uuid.hpp"

namespace {

    spatialbook::Timestamp sample_time() {
        // 2024-05-01T12:30:45Z
        return spatialbook::Clock::from_time_t(1714566645);
    }

}

TEST(Iso8601, FormatsUtcSeconds) {
    EXPECT_EQ(spatialbook::format_iso8601(sample_time()), "2024-05-01T12:30:45Z");
}

TEST(Iso8601, ParsesFormattedValue) {
    const auto parsed = spatialbook::parse_iso8601("2024-05-01T12:30:45Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, sample_time());
}

TEST(Iso8601, ParsesFractionAndOffset) {
    const auto parsed = spatialbook::parse_iso8601("2024-05-01T14:30:45.250+02:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, sample_time());
}

TEST(Iso8601, RejectsGarbage) {
    EXPECT_FALSE(spatialbook::parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(spatialbook::parse_iso8601("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(spatialbook::parse_iso8601("2024-05-01T12:30:45Zjunk").has_value());
}

TEST(FileStamps, UseUtcFields) {
    EXPECT_EQ(spatialbook::format_compact_stamp(sample_time()), "20240501_123045");
    EXPECT_EQ(spatialbook::format_file_stamp(sample_time()), "2024-05-01_12-30-45");
}

TEST(Uuid, GeneratesVersionFourIdentifiers) {
    const auto first  = spatialbook::generate_uuid();
    const auto second = spatialbook::generate_uuid();

    EXPECT_TRUE(spatialbook::is_valid_uuid(first));
    EXPECT_NE(first, second);
    EXPECT_EQ(first[14], '4');
    EXPECT_FALSE(spatialbook::is_valid_uuid("not-a-uuid"));
}
