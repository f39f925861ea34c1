#ifndef SPATIALBOOK_TIME_UTILS_HPP
#define SPATIALBOOK_TIME_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace spatialbook {

    using Clock       = std::chrono::system_clock;
    using Timestamp   = Clock::time_point;
    using ClockSource = std::function<Timestamp()>;

    // "2024-05-01T12:30:00Z", UTC, second precision.
    std::string              format_iso8601(Timestamp time);
    std::optional<Timestamp> parse_iso8601(std::string_view text);

    // "20240501_123000" and "2024-05-01_12-30-00" respectively, UTC.
    std::string              format_compact_stamp(Timestamp time);
    std::string              format_file_stamp(Timestamp time);

    Timestamp                to_system_time(std::filesystem::file_time_type time);

} // namespace spatialbook

#endif // SPATIALBOOK_TIME_UTILS_HPP
