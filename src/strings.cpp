#include "spatialbook/strings.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>

namespace spatialbook {

    std::string_view trim_view(std::string_view value) {
        size_t start = 0;
        while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
            ++start;
        }
        size_t end = value.size();
        while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
            --end;
        }
        return value.substr(start, end - start);
    }

    std::string trim_copy(std::string_view value) {
        return std::string(trim_view(value));
    }

    std::string to_lower_copy(std::string_view value) {
        std::string out;
        out.reserve(value.size());
        for (const char ch : value) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        return out;
    }

    bool contains_case_insensitive(std::string_view haystack, std::string_view needle) {
        if (needle.empty()) {
            return true;
        }
        return to_lower_copy(haystack).find(to_lower_copy(needle)) != std::string::npos;
    }

    std::vector<std::string> split_lines(std::string_view text) {
        std::vector<std::string> lines;
        size_t                   start = 0;
        while (true) {
            const auto newline = text.find('\n', start);
            auto       line    = text.substr(start, newline == std::string_view::npos ? std::string_view::npos : newline - start);
            if (line.ends_with('\r')) {
                line.remove_suffix(1);
            }
            lines.emplace_back(line);
            if (newline == std::string_view::npos) {
                break;
            }
            start = newline + 1;
        }
        return lines;
    }

    std::string join_lines(const std::vector<std::string>& lines) {
        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) {
                out.push_back('\n');
            }
            out.append(lines[i]);
        }
        return out;
    }

    std::string sanitize_file_stem(std::string_view name) {
        std::string out;
        out.reserve(name.size());
        for (const char ch : trim_view(name)) {
            const auto uch = static_cast<unsigned char>(ch);
            if (std::isalnum(uch) || ch == '-') {
                out.push_back(static_cast<char>(std::tolower(uch)));
            } else {
                out.push_back('_');
            }
        }
        if (out.empty()) {
            return "workspace";
        }
        return out;
    }

    std::string format_number(double value) {
        if (std::isnan(value)) {
            return "np.nan";
        }
        if (std::isinf(value)) {
            return value > 0 ? "np.inf" : "-np.inf";
        }
        std::array<char, 64> buffer{};
        const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
        if (ec != std::errc{}) {
            return "0.0";
        }
        std::string text(buffer.data(), end);
        if (text.find_first_of(".e") == std::string::npos) {
            text.append(".0");
        }
        return text;
    }

    std::optional<double> parse_number(std::string_view text) {
        text = trim_view(text);
        if (text.starts_with('+')) {
            text.remove_prefix(1);
        }
        if (text.empty()) {
            return std::nullopt;
        }
        double     value = 0.0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<int> parse_int(std::string_view text) {
        text = trim_view(text);
        if (text.empty()) {
            return std::nullopt;
        }
        int        value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

}
