#include "spatialbook/payload_extractors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <utility>

#include "spatialbook/strings.hpp"

namespace spatialbook {

    namespace {

        // Cursor over Python literal syntax as emitted by the code generators.
        class LiteralScanner {
          public:
            LiteralScanner(std::string_view text, size_t pos) : text_(text), pos_(pos) {}

            void skip_space() {
                while (pos_ < text_.size()) {
                    const char ch = text_[pos_];
                    if (std::isspace(static_cast<unsigned char>(ch))) {
                        ++pos_;
                        continue;
                    }
                    if (ch == '#') {
                        while (pos_ < text_.size() && text_[pos_] != '\n') {
                            ++pos_;
                        }
                        continue;
                    }
                    break;
                }
            }

            bool consume(char expected) {
                skip_space();
                if (pos_ < text_.size() && text_[pos_] == expected) {
                    ++pos_;
                    return true;
                }
                return false;
            }

            bool peek(char expected) {
                skip_space();
                return pos_ < text_.size() && text_[pos_] == expected;
            }

            std::optional<std::string> string_literal() {
                skip_space();
                if (pos_ >= text_.size() || (text_[pos_] != '\'' && text_[pos_] != '"')) {
                    return std::nullopt;
                }
                const char  quote = text_[pos_++];
                std::string value;
                while (pos_ < text_.size()) {
                    const char ch = text_[pos_++];
                    if (ch == quote) {
                        return value;
                    }
                    if (ch == '\n') {
                        return std::nullopt;
                    }
                    if (ch != '\\') {
                        value.push_back(ch);
                        continue;
                    }
                    if (pos_ >= text_.size()) {
                        return std::nullopt;
                    }
                    const char escaped = text_[pos_++];
                    switch (escaped) {
                        case 'n': value.push_back('\n'); break;
                        case 't': value.push_back('\t'); break;
                        case 'r': value.push_back('\r'); break;
                        default: value.push_back(escaped); break;
                    }
                }
                return std::nullopt;
            }

            // Bare token such as a number, True or None.
            std::optional<std::string> scalar() {
                skip_space();
                const size_t start = pos_;
                while (pos_ < text_.size()) {
                    const char ch = text_[pos_];
                    if (ch == ',' || ch == ']' || ch == '}' || ch == ')' || ch == '\n') {
                        break;
                    }
                    ++pos_;
                }
                const auto token = trim_view(text_.substr(start, pos_ - start));
                if (token.empty()) {
                    return std::nullopt;
                }
                return std::string(token);
            }

            std::optional<std::string> value_text() {
                if (peek('\'') || peek('"')) {
                    return string_literal();
                }
                return scalar();
            }

            std::optional<std::vector<std::string>> text_list() {
                if (!consume('[')) {
                    return std::nullopt;
                }
                std::vector<std::string> values;
                while (!consume(']')) {
                    auto value = value_text();
                    if (!value) {
                        return std::nullopt;
                    }
                    values.push_back(std::move(*value));
                    if (!consume(',') && !peek(']')) {
                        return std::nullopt;
                    }
                }
                return values;
            }

            std::optional<std::vector<double>> number_list() {
                const auto texts = text_list();
                if (!texts) {
                    return std::nullopt;
                }
                std::vector<double> values;
                values.reserve(texts->size());
                for (const auto& text : *texts) {
                    const auto value = parse_number(text);
                    if (!value) {
                        return std::nullopt;
                    }
                    values.push_back(*value);
                }
                return values;
            }

            std::optional<std::vector<std::vector<double>>> nested_number_list() {
                if (!consume('[')) {
                    return std::nullopt;
                }
                std::vector<std::vector<double>> rows;
                while (!consume(']')) {
                    auto row = number_list();
                    if (!row) {
                        return std::nullopt;
                    }
                    rows.push_back(std::move(*row));
                    if (!consume(',') && !peek(']')) {
                        return std::nullopt;
                    }
                }
                return rows;
            }

          private:
            std::string_view text_;
            size_t           pos_;
        };

        std::optional<size_t> search_end(std::string_view source, const std::regex& pattern) {
            std::match_results<std::string_view::const_iterator> match;
            if (!std::regex_search(source.begin(), source.end(), match, pattern)) {
                return std::nullopt;
            }
            return static_cast<size_t>(match.position(0) + match.length(0));
        }

        // Offset of the '[' opening `name = [...]` or `name = np.array([...])`.
        std::optional<size_t> find_assigned_list(std::string_view source, std::string_view name) {
            const std::regex pattern("\\b" + std::string(name) + "\\s{0,32}=\\s{0,32}(?:np\\.array\\(\\s{0,32})?\\[");
            const auto       end = search_end(source, pattern);
            if (!end) {
                return std::nullopt;
            }
            return *end - 1;
        }

        // Offset of the '[' opening `'key': [...]`.
        std::optional<size_t> find_keyed_list(std::string_view source, std::string_view key) {
            const std::regex pattern("['\"]" + std::string(key) + "['\"]\\s{0,32}:\\s{0,32}\\[");
            const auto       end = search_end(source, pattern);
            if (!end) {
                return std::nullopt;
            }
            return *end - 1;
        }

        std::optional<std::vector<double>> numbers_at(std::string_view source, std::optional<size_t> pos) {
            if (!pos) {
                return std::nullopt;
            }
            return LiteralScanner(source, *pos).number_list();
        }

        std::optional<double> assigned_number(std::string_view source, std::string_view name) {
            const std::regex pattern("\\b" + std::string(name) + "\\s{0,32}=");
            const auto       end = search_end(source, pattern);
            if (!end) {
                return std::nullopt;
            }
            const auto token = LiteralScanner(source, *end).scalar();
            if (!token) {
                return std::nullopt;
            }
            return parse_number(*token);
        }

        bool is_identifier_start(char ch) {
            return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
        }

        bool is_identifier_char(char ch) {
            return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
        }

        // Plain decimal literal: optional sign, digits, optional fraction.
        bool is_decimal_literal(std::string_view text) {
            if (text.starts_with('-')) {
                text.remove_prefix(1);
            }
            const auto dot     = text.find('.');
            const auto integer = text.substr(0, dot);
            const auto all_digits = [](std::string_view part) {
                return !part.empty() && std::ranges::all_of(part, [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
            };
            if (!all_digits(integer)) {
                return false;
            }
            return dot == std::string_view::npos || all_digits(text.substr(dot + 1));
        }

        // `name = 12.5` on a line of its own.
        std::optional<std::pair<std::string, double>> numeric_assignment(std::string_view line) {
            line = trim_view(line);
            if (line.empty() || !is_identifier_start(line.front())) {
                return std::nullopt;
            }
            size_t name_end = 1;
            while (name_end < line.size() && is_identifier_char(line[name_end])) {
                ++name_end;
            }
            const auto rest = trim_view(line.substr(name_end));
            if (!rest.starts_with('=')) {
                return std::nullopt;
            }
            const auto literal = trim_view(rest.substr(1));
            if (!is_decimal_literal(literal)) {
                return std::nullopt;
            }
            const auto value = parse_number(literal);
            if (!value) {
                return std::nullopt;
            }
            return std::make_pair(std::string(line.substr(0, name_end)), *value);
        }

        std::optional<int> face_index(double value) {
            if (!std::isfinite(value) || value < 0.0 || value > static_cast<double>(std::numeric_limits<int>::max()) || std::trunc(value) != value) {
                return std::nullopt;
            }
            return static_cast<int>(value);
        }

        // Text after `prefix` on the first line that starts with it.
        std::optional<std::string> line_value(std::string_view source, std::string_view prefix) {
            size_t pos = 0;
            while (pos < source.size()) {
                const auto end  = source.find('\n', pos);
                const auto line = source.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos);
                if (line.starts_with(prefix)) {
                    return trim_copy(line.substr(prefix.size()));
                }
                if (end == std::string_view::npos) {
                    break;
                }
                pos = end + 1;
            }
            return std::nullopt;
        }

        std::optional<std::string> call_argument(std::string_view source, std::string_view call) {
            const auto pos = source.find(call);
            if (pos == std::string_view::npos) {
                return std::nullopt;
            }
            return LiteralScanner(source, pos + call.size()).string_literal();
        }

        std::optional<std::string> leading_title(std::string_view source) {
            const auto first = trim_view(source.substr(0, source.find('\n')));
            if (first.starts_with("# ") && first.size() > 2) {
                return std::string(trim_view(first.substr(2)));
            }
            return std::nullopt;
        }

        std::optional<std::string> dtype_from_conversion(std::string_view rhs) {
            if (rhs.find("astype('Int64')") != std::string_view::npos) {
                return "int";
            }
            if (rhs.find("pd.to_numeric") != std::string_view::npos) {
                return "float";
            }
            if (rhs.find("pd.to_datetime") != std::string_view::npos) {
                return "datetime";
            }
            if (rhs.find("astype('boolean')") != std::string_view::npos) {
                return "bool";
            }
            return std::nullopt;
        }

        std::map<std::string, std::string> extract_dtypes(std::string_view source) {
            std::map<std::string, std::string> dtypes;
            for (const auto& line : split_lines(source)) {
                const auto trimmed = trim_view(line);
                if (!trimmed.starts_with("df[")) {
                    continue;
                }
                LiteralScanner scanner(trimmed, 3);
                const auto     column = scanner.string_literal();
                const auto     equals = trimmed.find("] =");
                if (!column || equals == std::string_view::npos) {
                    continue;
                }
                if (const auto dtype = dtype_from_conversion(trimmed.substr(equals + 3))) {
                    dtypes[*column] = *dtype;
                }
            }
            return dtypes;
        }

        std::string chart_type_from(std::string_view source) {
            if (const auto declared = line_value(source, "# Chart type:")) {
                if (!declared->empty()) {
                    return *declared;
                }
            }
            const auto lowered = to_lower_copy(source);
            if (lowered.find("scatter(") != std::string::npos) {
                return "scatter";
            }
            if (lowered.find(".bar(") != std::string::npos) {
                return "bar";
            }
            if (lowered.find("fill_between(") != std::string::npos) {
                return "area";
            }
            return "line";
        }

        std::optional<PointCloudData> point_cloud_from_keyed_lists(std::string_view source) {
            const auto xs = numbers_at(source, find_keyed_list(source, "x"));
            const auto ys = numbers_at(source, find_keyed_list(source, "y"));
            const auto zs = numbers_at(source, find_keyed_list(source, "z"));
            if (!xs || !ys || !zs) {
                return std::nullopt;
            }
            PointCloudData data;
            if (const auto title = leading_title(source)) {
                data.title = *title;
            }
            const size_t count = std::min({xs->size(), ys->size(), zs->size()});
            for (size_t i = 0; i < count; ++i) {
                data.points.push_back(PointSample{.x = (*xs)[i], .y = (*ys)[i], .z = (*zs)[i]});
            }
            if (data.points.empty()) {
                return std::nullopt;
            }
            return data;
        }

        std::optional<VolumeMetrics> metrics_from_assignments(std::string_view source) {
            VolumeMetrics data;
            for (const auto& line : split_lines(source)) {
                if (auto assignment = numeric_assignment(line)) {
                    data.metrics[std::move(assignment->first)] = assignment->second;
                }
            }
            if (data.metrics.empty()) {
                return std::nullopt;
            }
            if (const auto title = leading_title(source)) {
                data.title = *title;
            }
            return data;
        }

        template <typename T>
        PayloadReconstructor wrap(std::function<std::optional<T>(std::string_view, size_t)> fn) {
            return [fn = std::move(fn)](std::string_view source, size_t match_end) -> std::optional<WindowPayload> {
                auto result = fn(source, match_end);
                if (!result) {
                    return std::nullopt;
                }
                return WindowPayload{std::move(*result)};
            };
        }

    } // namespace

    std::optional<TabularData> extract_tabular_dict(std::string_view source, size_t body_start) {
        LiteralScanner                        scanner(source, body_start);
        std::vector<std::string>              columns;
        std::vector<std::vector<std::string>> values;
        while (!scanner.consume('}')) {
            auto key = scanner.string_literal();
            if (!key || !scanner.consume(':')) {
                return std::nullopt;
            }
            auto column_values = scanner.text_list();
            if (!column_values) {
                return std::nullopt;
            }
            columns.push_back(std::move(*key));
            values.push_back(std::move(*column_values));
            if (!scanner.consume(',') && !scanner.peek('}')) {
                return std::nullopt;
            }
        }
        if (columns.empty()) {
            return std::nullopt;
        }

        TabularData data;
        data.columns     = std::move(columns);
        size_t row_count = 0;
        for (const auto& column : values) {
            row_count = std::max(row_count, column.size());
        }
        data.rows.assign(row_count, std::vector<std::string>(data.columns.size()));
        for (size_t column = 0; column < values.size(); ++column) {
            for (size_t row = 0; row < values[column].size(); ++row) {
                data.rows[row][column] = values[column][row];
            }
        }
        data.dtypes = extract_dtypes(source);
        return data;
    }

    std::optional<ChartData> extract_chart_arrays(std::string_view source, std::string_view x_name, std::string_view y_name) {
        const auto xs = numbers_at(source, find_assigned_list(source, x_name));
        const auto ys = numbers_at(source, find_assigned_list(source, y_name));
        if (!xs || !ys) {
            return std::nullopt;
        }
        ChartData data;
        data.x_data     = *xs;
        data.y_data     = *ys;
        data.chart_type = chart_type_from(source);
        if (const auto title = leading_title(source)) {
            data.title = *title;
        } else if (const auto plotted = call_argument(source, "plt.title(")) {
            data.title = *plotted;
        } else if (const auto axis_title = call_argument(source, "ax.set_title(")) {
            data.title = *axis_title;
        }
        if (const auto label = call_argument(source, "ax.set_xlabel(")) {
            data.x_label = *label;
        }
        if (const auto label = call_argument(source, "ax.set_ylabel(")) {
            data.y_label = *label;
        }
        data.color = call_argument(source, "color=");
        data.style = call_argument(source, "linestyle=");
        return data;
    }

    std::optional<PointCloudData> extract_point_arrays(std::string_view source) {
        const auto xs = numbers_at(source, find_assigned_list(source, "x_points"));
        const auto ys = numbers_at(source, find_assigned_list(source, "y_points"));
        const auto zs = numbers_at(source, find_assigned_list(source, "z_points"));
        if (!xs || !ys || !zs) {
            return std::nullopt;
        }
        const auto     intensities = numbers_at(source, find_assigned_list(source, "intensities"));

        PointCloudData data;
        if (const auto title = leading_title(source)) {
            data.title = *title;
        }
        if (const auto demo = line_value(source, "# Demo type:")) {
            data.demo_type = *demo;
        }
        if (const auto parameters = line_value(source, "# Parameters:")) {
            size_t pos = 0;
            while (pos < parameters->size()) {
                const auto comma = parameters->find(',', pos);
                const auto entry = std::string_view(*parameters).substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
                const auto eq    = entry.find('=');
                if (eq != std::string_view::npos) {
                    if (const auto value = parse_number(entry.substr(eq + 1))) {
                        data.parameters[trim_copy(entry.substr(0, eq))] = *value;
                    }
                }
                if (comma == std::string::npos) {
                    break;
                }
                pos = comma + 1;
            }
        }
        if (const auto label = call_argument(source, "ax.set_xlabel(")) {
            data.x_label = *label;
        }
        if (const auto label = call_argument(source, "ax.set_ylabel(")) {
            data.y_label = *label;
        }
        if (const auto label = call_argument(source, "ax.set_zlabel(")) {
            data.z_label = *label;
        }

        const size_t count = std::min({xs->size(), ys->size(), zs->size()});
        for (size_t i = 0; i < count; ++i) {
            PointSample point{.x = (*xs)[i], .y = (*ys)[i], .z = (*zs)[i]};
            if (intensities && i < intensities->size()) {
                point.intensity = (*intensities)[i];
            }
            data.points.push_back(point);
        }
        if (data.points.empty()) {
            return std::nullopt;
        }
        return data;
    }

    std::optional<VolumeMetrics> extract_metrics_dict(std::string_view source, size_t body_start) {
        LiteralScanner scanner(source, body_start);
        VolumeMetrics  data;
        while (!scanner.consume('}')) {
            const auto key = scanner.string_literal();
            if (!key || !scanner.consume(':')) {
                return std::nullopt;
            }
            const auto value = scanner.value_text();
            if (!value) {
                return std::nullopt;
            }
            if (const auto number = parse_number(*value)) {
                data.metrics[*key] = *number;
            }
            if (!scanner.consume(',') && !scanner.peek('}')) {
                return std::nullopt;
            }
        }
        if (data.metrics.empty()) {
            return std::nullopt;
        }
        if (const auto title = leading_title(source)) {
            data.title = *title;
        }
        if (const auto category = line_value(source, "# Category:")) {
            data.category = *category;
        }
        if (const auto unit = line_value(source, "# Unit:")) {
            data.unit = *unit;
        }
        return data;
    }

    std::optional<ModelData> extract_model_arrays(std::string_view source, size_t vertices_start) {
        const auto rows = LiteralScanner(source, vertices_start).nested_number_list();
        if (!rows) {
            return std::nullopt;
        }
        ModelData data;
        for (const auto& row : *rows) {
            if (row.size() >= 3) {
                data.vertices.push_back(Vec3{.x = row[0], .y = row[1], .z = row[2]});
            }
        }
        if (data.vertices.empty()) {
            return std::nullopt;
        }

        auto faces_pos = find_assigned_list(source, "faces");
        if (!faces_pos) {
            faces_pos = find_keyed_list(source, "faces");
        }
        if (faces_pos) {
            if (const auto faces = LiteralScanner(source, *faces_pos).nested_number_list()) {
                for (const auto& face : *faces) {
                    ModelFace entry;
                    for (const double value : face) {
                        const auto index = face_index(value);
                        if (!index) {
                            entry.indices.clear();
                            break;
                        }
                        entry.indices.push_back(*index);
                    }
                    // Faces with an index outside [0, INT_MAX] or a fractional index are dropped.
                    if (!entry.indices.empty()) {
                        data.faces.push_back(std::move(entry));
                    }
                }
            }
        }

        if (const auto title = leading_title(source)) {
            data.title = *title;
        }
        if (const auto type = line_value(source, "# Model type:")) {
            data.model_type = *type;
        } else {
            const auto lowered = to_lower_copy(source);
            if (lowered.find("sphere") != std::string::npos) {
                data.model_type = "sphere";
            } else if (lowered.find("cube") != std::string::npos) {
                data.model_type = "cube";
            }
        }
        if (const auto scale = assigned_number(source, "scale")) {
            data.scale = *scale;
        }
        if (const auto position = numbers_at(source, find_assigned_list(source, "position")); position && position->size() >= 3) {
            data.position = Vec3{.x = (*position)[0], .y = (*position)[1], .z = (*position)[2]};
        }
        if (const auto rotation = numbers_at(source, find_assigned_list(source, "rotation")); rotation && rotation->size() >= 3) {
            data.rotation = Vec3{.x = (*rotation)[0], .y = (*rotation)[1], .z = (*rotation)[2]};
        }

        size_t pos = 0;
        while ((pos = source.find("# Material: ", pos)) != std::string_view::npos) {
            const auto end   = source.find('\n', pos);
            const auto line  = trim_view(source.substr(pos + 12, end == std::string_view::npos ? std::string_view::npos : end - pos - 12));
            const auto paren = line.rfind(" (");
            ModelMaterial material;
            if (paren != std::string_view::npos && line.ends_with(')')) {
                material.name  = std::string(line.substr(0, paren));
                material.color = std::string(line.substr(paren + 2, line.size() - paren - 3));
            } else {
                material.name = std::string(line);
            }
            data.materials.push_back(std::move(material));
            pos += 12;
        }
        return data;
    }

    PayloadExtractors PayloadExtractors::with_default_matchers() {
        PayloadExtractors extractors;

        const auto        tabular = wrap<TabularData>(extract_tabular_dict);
        extractors.add_matcher(WindowType::kTabular, {"data-dict", std::regex(R"(\bdata\s{0,32}=\s{0,32}\{)"), tabular});
        extractors.add_matcher(WindowType::kTabular, {"dataframe-literal", std::regex(R"(pd\.DataFrame\(\s{0,32}\{)"), tabular});

        extractors.add_matcher(WindowType::kChart, {"named-arrays", std::regex(R"(\bx_data\s{0,32}=\s{0,32}(?:np\.array\(\s{0,32})?\[)"),
                                                    wrap<ChartData>([](std::string_view source, size_t) { return extract_chart_arrays(source, "x_data", "y_data"); })});
        extractors.add_matcher(WindowType::kChart, {"short-arrays", std::regex(R"(\bx\s{0,32}=\s{0,32}(?:np\.array\(\s{0,32})?\[)"),
                                                    wrap<ChartData>([](std::string_view source, size_t) { return extract_chart_arrays(source, "x", "y"); })});

        const auto point_arrays = wrap<PointCloudData>([](std::string_view source, size_t) { return extract_point_arrays(source); });
        const auto point_keyed  = wrap<PointCloudData>([](std::string_view source, size_t) { return point_cloud_from_keyed_lists(source); });
        for (const auto type : {WindowType::kPointCloud, WindowType::kSpatialEditor}) {
            extractors.add_matcher(type, {"point-arrays", std::regex(R"(\bx_points\s{0,32}=\s{0,32}(?:np\.array\(\s{0,32})?\[)"), point_arrays});
            extractors.add_matcher(type, {"points-dict", std::regex(R"(\bpoints_data\s{0,32}=\s{0,32}\{)"), point_keyed});
            extractors.add_matcher(type, {"keyed-axes", std::regex(R"(['"]x['"]\s{0,32}:\s{0,32}\[)"), point_keyed});
        }

        extractors.add_matcher(WindowType::kVolumetric, {"metrics-dict", std::regex(R"(\b(?:metrics|performance|volume_data|model_metrics)\s{0,32}=\s{0,32}\{)"),
                                                         wrap<VolumeMetrics>(extract_metrics_dict)});
        extractors.add_matcher(WindowType::kVolumetric, {"numeric-assignments", std::regex(R"(\b[A-Za-z_]\w{0,63}\s{0,32}=\s{0,32}-?[0-9])"),
                                                         wrap<VolumeMetrics>([](std::string_view source, size_t) { return metrics_from_assignments(source); })});

        const auto model = wrap<ModelData>([](std::string_view source, size_t match_end) { return extract_model_arrays(source, match_end - 1); });
        extractors.add_matcher(WindowType::kModel3D, {"vertex-array", std::regex(R"(\bvertices\s{0,32}=\s{0,32}(?:np\.array\(\s{0,32})?\[)"), model});
        extractors.add_matcher(WindowType::kModel3D, {"keyed-vertices", std::regex(R"(['"]vertices['"]\s{0,32}:\s{0,32}\[)"), model});

        return extractors;
    }

    void PayloadExtractors::add_matcher(WindowType type, PayloadMatcher matcher) {
        matchers_[type].push_back(std::move(matcher));
    }

    const PayloadMatcher* PayloadExtractors::find_match(WindowType type, const std::string& source, size_t* match_end) const {
        const auto it = matchers_.find(type);
        if (it == matchers_.end()) {
            return nullptr;
        }
        for (const auto& matcher : it->second) {
            if (const auto end = search_end(source, matcher.marker)) {
                *match_end = *end;
                return &matcher;
            }
        }
        return nullptr;
    }

    std::optional<WindowPayload> PayloadExtractors::extract(WindowType type, const std::string& source) const {
        size_t     match_end = 0;
        const auto matcher   = find_match(type, source, &match_end);
        if (!matcher || !matcher->reconstruct) {
            return std::nullopt;
        }
        return matcher->reconstruct(source, match_end);
    }

    std::optional<std::string> PayloadExtractors::matching_matcher(WindowType type, const std::string& source) const {
        size_t     match_end = 0;
        const auto matcher   = find_match(type, source, &match_end);
        if (!matcher) {
            return std::nullopt;
        }
        return matcher->name;
    }

    size_t PayloadExtractors::matcher_count(WindowType type) const {
        const auto it = matchers_.find(type);
        return it == matchers_.end() ? 0 : it->second.size();
    }

} // namespace spatialbook
