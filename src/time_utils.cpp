#include "spatialbook/time_utils.hpp"

#include <array>
#include <cstdio>
#include <ctime>

#include "spatialbook/strings.hpp"

namespace spatialbook {

    namespace {

        std::tm to_utc(Timestamp time) {
            const std::time_t seconds = Clock::to_time_t(time);
            std::tm           utc{};
            gmtime_r(&seconds, &utc);
            return utc;
        }

        std::string format_with(Timestamp time, const char* pattern) {
            const auto           utc = to_utc(time);
            std::array<char, 64> buffer{};
            const auto           written = std::strftime(buffer.data(), buffer.size(), pattern, &utc);
            return std::string(buffer.data(), written);
        }

        std::optional<int> field(std::string_view text, size_t offset, size_t length) {
            if (offset + length > text.size()) {
                return std::nullopt;
            }
            return parse_int(text.substr(offset, length));
        }

    } // namespace

    std::string format_iso8601(Timestamp time) {
        return format_with(time, "%Y-%m-%dT%H:%M:%SZ");
    }

    std::optional<Timestamp> parse_iso8601(std::string_view text) {
        text = trim_view(text);
        // YYYY-MM-DDTHH:MM:SS with optional fraction and Z or +HH:MM suffix.
        if (text.size() < 19 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
            return std::nullopt;
        }
        const auto year   = field(text, 0, 4);
        const auto month  = field(text, 5, 2);
        const auto day    = field(text, 8, 2);
        const auto hour   = field(text, 11, 2);
        const auto minute = field(text, 14, 2);
        const auto second = field(text, 17, 2);
        if (!year || !month || !day || !hour || !minute || !second) {
            return std::nullopt;
        }
        if (*month < 1 || *month > 12 || *day < 1 || *day > 31 || *hour > 23 || *minute > 59 || *second > 60) {
            return std::nullopt;
        }

        size_t pos = 19;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                ++pos;
            }
        }
        int offset_seconds = 0;
        if (pos < text.size()) {
            const char sign = text[pos];
            if (sign == 'Z' && pos + 1 == text.size()) {
                offset_seconds = 0;
            } else if ((sign == '+' || sign == '-') && text.size() == pos + 6 && text[pos + 3] == ':') {
                const auto offset_hours   = field(text, pos + 1, 2);
                const auto offset_minutes = field(text, pos + 4, 2);
                if (!offset_hours || !offset_minutes) {
                    return std::nullopt;
                }
                offset_seconds = (*offset_hours * 3600 + *offset_minutes * 60) * (sign == '-' ? -1 : 1);
            } else {
                return std::nullopt;
            }
        }

        std::tm utc{};
        utc.tm_year             = *year - 1900;
        utc.tm_mon              = *month - 1;
        utc.tm_mday             = *day;
        utc.tm_hour             = *hour;
        utc.tm_min              = *minute;
        utc.tm_sec              = *second;
        const std::time_t epoch = timegm(&utc);
        if (epoch == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        return Clock::from_time_t(epoch - offset_seconds);
    }

    std::string format_compact_stamp(Timestamp time) {
        return format_with(time, "%Y%m%d_%H%M%S");
    }

    std::string format_file_stamp(Timestamp time) {
        return format_with(time, "%Y-%m-%d_%H-%M-%S");
    }

    Timestamp to_system_time(std::filesystem::file_time_type time) {
        return std::chrono::time_point_cast<Clock::duration>(std::chrono::file_clock::to_sys(time));
    }

} // namespace spatialbook
