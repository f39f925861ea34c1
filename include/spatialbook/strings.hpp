#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spatialbook {

    std::string_view         trim_view(std::string_view value);
    std::string              trim_copy(std::string_view value);
    std::string              to_lower_copy(std::string_view value);
    bool                     contains_case_insensitive(std::string_view haystack, std::string_view needle);

    std::vector<std::string> split_lines(std::string_view text);
    std::string              join_lines(const std::vector<std::string>& lines);

    // Lowercase file stem with anything outside [a-z0-9-] replaced by '_'.
    std::string              sanitize_file_stem(std::string_view name);

    // Shortest round-trippable decimal, always carrying a fractional part ("2.0", "0.25").
    std::string              format_number(double value);
    std::optional<double>    parse_number(std::string_view text);
    std::optional<int>       parse_int(std::string_view text);

}
