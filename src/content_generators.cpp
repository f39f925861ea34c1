#include "spatialbook/content_generators.hpp"

#include <algorithm>
#include <cctype>

#include "spatialbook/strings.hpp"

namespace spatialbook {

    namespace {

        std::string comment_text(std::string_view value) {
            std::string out(value);
            std::ranges::replace(out, '\n', ' ');
            std::ranges::replace(out, '\r', ' ');
            return out;
        }

        std::string number_list(const std::vector<double>& values) {
            std::string out;
            for (size_t i = 0; i < values.size(); ++i) {
                if (i > 0) {
                    out.append(", ");
                }
                out.append(format_number(values[i]));
            }
            return out;
        }

        template <typename Fn>
        std::vector<double> project(const std::vector<PointSample>& points, Fn&& fn) {
            std::vector<double> values;
            values.reserve(points.size());
            for (const auto& point : points) {
                values.push_back(fn(point));
            }
            return values;
        }

        std::string double_quoted(std::string_view value) {
            std::string out = "\"";
            for (const char ch : value) {
                if (ch == '\\' || ch == '"') {
                    out.push_back('\\');
                }
                out.push_back(ch == '\n' ? ' ' : ch);
            }
            out.push_back('"');
            return out;
        }

        std::string vec3_text(const Vec3& value) {
            return "[" + format_number(value.x) + ", " + format_number(value.y) + ", " + format_number(value.z) + "]";
        }

        std::string plot_call(const ChartData& data) {
            std::string extras;
            if (data.color) {
                extras += ", color=" + python_string_literal(*data.color);
            }
            const auto type = to_lower_copy(data.chart_type);
            if (type == "scatter") {
                return "ax.scatter(x_data, y_data" + extras + ", alpha=0.7)";
            }
            if (type == "bar") {
                return "ax.bar(x_data, y_data" + extras + ")";
            }
            if (type == "area") {
                return "ax.fill_between(x_data, y_data" + extras + ", alpha=0.6)";
            }
            if (data.style) {
                extras += ", linestyle=" + python_string_literal(*data.style);
            }
            return "ax.plot(x_data, y_data" + extras + ", marker='o', linewidth=2)";
        }

        std::string dtype_conversion(const std::string& column, const std::string& dtype) {
            const auto column_ref = "df[" + python_string_literal(column) + "]";
            const auto lowered    = to_lower_copy(dtype);
            if (lowered == "int" || lowered == "integer") {
                return column_ref + " = pd.to_numeric(" + column_ref + ", errors='coerce').astype('Int64')";
            }
            if (lowered == "float" || lowered == "numeric") {
                return column_ref + " = pd.to_numeric(" + column_ref + ", errors='coerce')";
            }
            if (lowered == "datetime" || lowered == "date") {
                return column_ref + " = pd.to_datetime(" + column_ref + ", errors='coerce')";
            }
            if (lowered == "bool" || lowered == "boolean") {
                return column_ref + " = " + column_ref + ".astype('boolean')";
            }
            return "# " + comment_text(column) + ": " + comment_text(dtype);
        }

        std::string template_imports(ExportTemplate value) {
            switch (value) {
                case ExportTemplate::kMatplotlib: return "import matplotlib.pyplot as plt\nimport numpy as np\n";
                case ExportTemplate::kPandas: return "import pandas as pd\nimport numpy as np\n";
                case ExportTemplate::kNumpy: return "import numpy as np\n";
                case ExportTemplate::kPlotly: return "import plotly.graph_objects as go\nimport plotly.express as px\n";
                case ExportTemplate::kSeaborn: return "import seaborn as sns\nimport matplotlib.pyplot as plt\nimport pandas as pd\n";
                case ExportTemplate::kPlain:
                case ExportTemplate::kCustom:
                case ExportTemplate::kMarkdown: return "";
            }
            return "";
        }

        std::string position_text(const WindowPosition& position) {
            return "(" + format_number(position.x) + ", " + format_number(position.y) + ", " + format_number(position.z) + ")";
        }

        // "# <kind> Window #<id>" or its markdown "## " form.
        bool is_fallback_title(std::string_view line) {
            if (line.starts_with("## ")) {
                line.remove_prefix(3);
            } else if (line.starts_with("# ")) {
                line.remove_prefix(2);
            } else {
                return false;
            }
            constexpr std::string_view kMarker = " Window #";
            const auto                 marker  = line.rfind(kMarker);
            if (marker == std::string_view::npos || marker == 0) {
                return false;
            }
            const auto id = line.substr(marker + kMarker.size());
            return !id.empty() && std::ranges::all_of(id, [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
        }

    } // namespace

    std::string python_string_literal(std::string_view value) {
        std::string out = "'";
        for (const char ch : value) {
            switch (ch) {
                case '\\': out.append("\\\\"); break;
                case '\'': out.append("\\'"); break;
                case '\n': out.append("\\n"); break;
                case '\r': out.append("\\r"); break;
                case '\t': out.append("\\t"); break;
                default: out.push_back(ch); break;
            }
        }
        out.push_back('\'');
        return out;
    }

    std::string generate_tabular_code(const TabularData& data) {
        if (data.columns.empty() || data.rows.empty()) {
            return "# Empty DataFrame\nimport pandas as pd\ndf = pd.DataFrame()\nprint('No data available')";
        }

        std::string code = "# DataFrame Analysis\n"
                           "# Generated by spatialbook DataFrame Viewer\n"
                           "\n"
                           "import pandas as pd\n"
                           "import numpy as np\n"
                           "import matplotlib.pyplot as plt\n"
                           "\n";
        code += "# DataFrame data (" + std::to_string(data.rows.size()) + " rows, " + std::to_string(data.columns.size()) + " columns)\n";
        code += "data = {\n";
        for (size_t column = 0; column < data.columns.size(); ++column) {
            code += "    " + python_string_literal(data.columns[column]) + ": [";
            for (size_t row = 0; row < data.rows.size(); ++row) {
                if (row > 0) {
                    code += ", ";
                }
                const auto& cells = data.rows[row];
                code += python_string_literal(column < cells.size() ? cells[column] : std::string{});
            }
            code += "],\n";
        }
        code += "}\n\ndf = pd.DataFrame(data)\n\n";

        if (!data.dtypes.empty()) {
            code += "# Convert data types\n";
            for (const auto& [column, dtype] : data.dtypes) {
                code += dtype_conversion(column, dtype) + "\n";
            }
            code += "\n";
        }

        code += "print(\"DataFrame Analysis Report\")\n"
                "print(\"=\" * 50)\n"
                "print(f\"Shape: {df.shape}\")\n"
                "print(f\"Columns: {list(df.columns)}\")\n"
                "print(df.dtypes)\n"
                "print(df.describe(include='all'))\n"
                "\n"
                "numeric_cols = df.select_dtypes(include=[np.number]).columns\n"
                "if len(numeric_cols) > 0:\n"
                "    df[numeric_cols].hist(figsize=(12, 8))\n"
                "    plt.tight_layout()\n"
                "    plt.show()\n"
                "\n"
                "df.head(10)";
        return code;
    }

    std::string generate_chart_code(const ChartData& data) {
        if (data.x_data.empty() || data.y_data.empty()) {
            return "# Empty chart data\nprint('No chart data available')";
        }

        std::string code = "# " + comment_text(data.title) + "\n";
        code += "# Chart type: " + comment_text(data.chart_type) + "\n";
        code += "# Generated by spatialbook Chart Window\n"
                "\n"
                "import numpy as np\n"
                "import matplotlib.pyplot as plt\n"
                "import pandas as pd\n"
                "\n"
                "# Chart data\n";
        code += "x_data = np.array([" + number_list(data.x_data) + "])\n";
        code += "y_data = np.array([" + number_list(data.y_data) + "])\n";
        code += "\n"
                "fig, ax = plt.subplots(figsize=(10, 6))\n";
        code += plot_call(data) + "\n";
        code += "ax.set_xlabel(" + python_string_literal(data.x_label) + ")\n";
        code += "ax.set_ylabel(" + python_string_literal(data.y_label) + ")\n";
        code += "ax.set_title(" + python_string_literal(data.title) + ")\n";
        code += "ax.grid(True, alpha=0.3)\n"
                "plt.tight_layout()\n"
                "plt.show()\n"
                "\n"
                "print(\"Chart Data Statistics:\")\n"
                "print(f\"Data points: {len(x_data)}\")\n"
                "print(f\"X range: [{np.min(x_data):.3f}, {np.max(x_data):.3f}]\")\n"
                "print(f\"Y range: [{np.min(y_data):.3f}, {np.max(y_data):.3f}]\")\n"
                "\n"
                "df = pd.DataFrame({'X': x_data, 'Y': y_data})\n"
                "df.head()";
        return code;
    }

    std::string generate_point_cloud_code(const PointCloudData& data) {
        if (data.points.empty()) {
            return "# Empty point cloud\nprint('No point cloud data available')";
        }

        const bool  has_intensity = std::ranges::any_of(data.points, [](const PointSample& point) { return point.intensity.has_value(); });
        std::string parameters;
        for (const auto& [key, value] : data.parameters) {
            if (!parameters.empty()) {
                parameters += ", ";
            }
            parameters += comment_text(key) + "=" + format_number(value);
        }

        std::string code = "# " + comment_text(data.title) + "\n";
        code += "# Demo type: " + comment_text(data.demo_type) + "\n";
        if (!parameters.empty()) {
            code += "# Parameters: " + parameters + "\n";
        }
        code += "# Generated by spatialbook Point Cloud Viewer\n"
                "\n"
                "import numpy as np\n"
                "import matplotlib.pyplot as plt\n"
                "\n";
        code += "# Point cloud data (" + std::to_string(data.points.size()) + " points)\n";
        code += "x_points = np.array([" + number_list(project(data.points, [](const PointSample& p) { return p.x; })) + "])\n";
        code += "y_points = np.array([" + number_list(project(data.points, [](const PointSample& p) { return p.y; })) + "])\n";
        code += "z_points = np.array([" + number_list(project(data.points, [](const PointSample& p) { return p.z; })) + "])\n";
        if (has_intensity) {
            code += "intensities = np.array([" + number_list(project(data.points, [](const PointSample& p) { return p.intensity.value_or(0.0); })) + "])\n";
        }
        code += "\n"
                "fig = plt.figure(figsize=(12, 10))\n"
                "ax = fig.add_subplot(111, projection='3d')\n";
        code += has_intensity ? "scatter = ax.scatter(x_points, y_points, z_points, c=intensities, cmap='viridis', alpha=0.7)\n"
                              : "scatter = ax.scatter(x_points, y_points, z_points, alpha=0.7)\n";
        code += "ax.set_xlabel(" + python_string_literal(data.x_label) + ")\n";
        code += "ax.set_ylabel(" + python_string_literal(data.y_label) + ")\n";
        code += "ax.set_zlabel(" + python_string_literal(data.z_label) + ")\n";
        code += "ax.set_title(" + python_string_literal(data.title) + ")\n";
        code += "plt.tight_layout()\n"
                "plt.show()\n"
                "\n"
                "print(f\"Total points: {len(x_points)}\")";
        return code;
    }

    std::string generate_volume_code(const VolumeMetrics& data) {
        if (data.metrics.empty()) {
            return "# Empty volume data\nprint('No volume data available')";
        }

        std::string code = "# " + comment_text(data.title) + "\n";
        code += "# Category: " + comment_text(data.category) + "\n";
        if (data.unit) {
            code += "# Unit: " + comment_text(*data.unit) + "\n";
        }
        code += "# Generated by spatialbook Model Metric Viewer\n"
                "\n"
                "import matplotlib.pyplot as plt\n"
                "import pandas as pd\n"
                "\n"
                "metrics = {\n";
        for (const auto& [key, value] : data.metrics) {
            code += "    " + double_quoted(key) + ": " + format_number(value) + ",\n";
        }
        code += "}\n"
                "\n"
                "df_metrics = pd.DataFrame(list(metrics.items()), columns=['Metric', 'Value'])\n"
                "for metric, value in metrics.items():\n";
        code += "    print(f\"{metric:20}: {value:10.3f} " + comment_text(data.unit.value_or("")) + "\")\n";
        code += "\n"
                "fig, ax = plt.subplots(figsize=(10, 6))\n"
                "ax.bar(df_metrics['Metric'], df_metrics['Value'])\n";
        code += "ax.set_title(" + python_string_literal(data.title) + ")\n";
        code += "ax.tick_params(axis='x', rotation=45)\n"
                "plt.tight_layout()\n"
                "plt.show()";
        return code;
    }

    std::string generate_model_code(const ModelData& data) {
        if (data.vertices.empty()) {
            return "# Empty 3D model\nprint('No 3D model data available')";
        }

        std::string code = "# " + comment_text(data.title) + "\n";
        code += "# Model type: " + comment_text(data.model_type) + "\n";
        for (const auto& material : data.materials) {
            code += "# Material: " + comment_text(material.name) + " (" + comment_text(material.color) + ")\n";
        }
        code += "# Generated by spatialbook 3D Model Viewer\n"
                "\n"
                "import numpy as np\n"
                "import matplotlib.pyplot as plt\n"
                "from mpl_toolkits.mplot3d.art3d import Poly3DCollection\n"
                "\n";
        code += "# 3D model data (" + std::to_string(data.vertices.size()) + " vertices, " + std::to_string(data.faces.size()) + " faces)\n";
        code += "vertices = np.array([\n";
        for (const auto& vertex : data.vertices) {
            code += "    " + vec3_text(vertex) + ",\n";
        }
        code += "])\n\nfaces = [\n";
        for (const auto& face : data.faces) {
            code += "    [";
            for (size_t i = 0; i < face.indices.size(); ++i) {
                if (i > 0) {
                    code += ", ";
                }
                code += std::to_string(face.indices[i]);
            }
            code += "],\n";
        }
        code += "]\n\n";
        code += "scale = " + format_number(data.scale) + "\n";
        code += "position = np.array(" + vec3_text(data.position) + ")\n";
        code += "rotation = np.array(" + vec3_text(data.rotation) + ")\n";
        code += "\n"
                "scaled_vertices = vertices * scale + position\n"
                "fig = plt.figure(figsize=(12, 10))\n"
                "ax = fig.add_subplot(111, projection='3d')\n"
                "mesh_faces = [scaled_vertices[face] for face in faces if len(face) >= 3]\n"
                "ax.add_collection3d(Poly3DCollection(mesh_faces, alpha=0.7, facecolor='lightblue', edgecolor='black'))\n"
                "ax.scatter(scaled_vertices[:, 0], scaled_vertices[:, 1], scaled_vertices[:, 2], c='red', s=20)\n";
        code += "ax.set_title(" + python_string_literal(data.title) + ")\n";
        code += "plt.tight_layout()\n"
                "plt.show()";
        return code;
    }

    std::string generate_cell_source(const WindowRecord& record) {
        const auto& payload = record.state.payload;
        switch (record.type) {
            case WindowType::kChart:
                if (const auto* chart = std::get_if<ChartData>(&payload)) {
                    return generate_chart_code(*chart);
                }
                break;
            case WindowType::kSpatialEditor:
            case WindowType::kPointCloud:
                if (const auto* cloud = std::get_if<PointCloudData>(&payload)) {
                    return generate_point_cloud_code(*cloud);
                }
                break;
            case WindowType::kTabular:
                if (const auto* table = std::get_if<TabularData>(&payload)) {
                    return generate_tabular_code(*table);
                }
                break;
            case WindowType::kVolumetric:
                if (const auto* metrics = std::get_if<VolumeMetrics>(&payload)) {
                    return generate_volume_code(*metrics);
                }
                break;
            case WindowType::kModel3D:
                if (const auto* model = std::get_if<ModelData>(&payload)) {
                    return generate_model_code(*model);
                }
                break;
        }
        return generate_fallback_source(record);
    }

    std::string generate_fallback_source(const WindowRecord& record) {
        const std::string title = std::string(window_type_name(record.type)) + " Window #" + std::to_string(record.id);
        if (record.state.export_template == ExportTemplate::kMarkdown) {
            std::string text = "## " + title + "\n";
            text += "**Position:** " + position_text(record.position) + "\n";
            text += "**Created:** " + format_iso8601(record.created_at) + "\n\n";
            text += record.state.content.empty() ? std::string("*No content available*") : record.state.content;
            return text;
        }

        std::string code = "# " + title + "\n";
        code += "# Position: " + position_text(record.position) + "\n";
        code += "# Created: " + format_iso8601(record.created_at) + "\n";
        code += template_imports(record.state.export_template);
        code += "\n";
        code += record.state.content;
        return code;
    }

    std::string strip_fallback_header(std::string_view source) {
        const auto first_break = source.find('\n');
        const auto first_line  = source.substr(0, first_break);
        if (first_break == std::string_view::npos || !is_fallback_title(first_line)) {
            return std::string(source);
        }
        const auto blank = source.find("\n\n", first_break);
        if (blank == std::string_view::npos) {
            return std::string(source);
        }
        auto content = std::string(source.substr(blank + 2));
        if (first_line.starts_with("## ") && content == "*No content available*") {
            content.clear();
        }
        return content;
    }

} // namespace spatialbook
