#include "spatialbook/types.hpp"

namespace spatialbook {

    std::string_view window_type_name(WindowType type) {
        switch (type) {
            case WindowType::kChart: return "Charts";
            case WindowType::kSpatialEditor: return "Spatial Editor";
            case WindowType::kTabular: return "DataFrame Viewer";
            case WindowType::kVolumetric: return "Model Metric Viewer";
            case WindowType::kPointCloud: return "Point Cloud Viewer";
            case WindowType::kModel3D: return "3D Model Viewer";
        }
        return "Charts";
    }

    std::optional<WindowType> parse_window_type(std::string_view value) {
        for (const auto type : all_window_types()) {
            if (window_type_name(type) == value) {
                return type;
            }
        }
        return std::nullopt;
    }

    const std::vector<WindowType>& all_window_types() {
        static const std::vector<WindowType> kTypes = {
            WindowType::kChart,      WindowType::kSpatialEditor, WindowType::kTabular,
            WindowType::kVolumetric, WindowType::kPointCloud,    WindowType::kModel3D,
        };
        return kTypes;
    }

    std::string_view export_template_name(ExportTemplate value) {
        switch (value) {
            case ExportTemplate::kPlain: return "Plain Text";
            case ExportTemplate::kMatplotlib: return "Matplotlib Chart";
            case ExportTemplate::kPandas: return "Pandas DataFrame";
            case ExportTemplate::kNumpy: return "NumPy Array";
            case ExportTemplate::kPlotly: return "Plotly Interactive";
            case ExportTemplate::kSeaborn: return "Seaborn Statistical";
            case ExportTemplate::kCustom: return "Custom Code";
            case ExportTemplate::kMarkdown: return "Markdown Only";
        }
        return "Plain Text";
    }

    std::optional<ExportTemplate> parse_export_template(std::string_view value) {
        constexpr ExportTemplate kTemplates[] = {
            ExportTemplate::kPlain,  ExportTemplate::kMatplotlib, ExportTemplate::kPandas, ExportTemplate::kNumpy,
            ExportTemplate::kPlotly, ExportTemplate::kSeaborn,    ExportTemplate::kCustom, ExportTemplate::kMarkdown,
        };
        for (const auto candidate : kTemplates) {
            if (export_template_name(candidate) == value) {
                return candidate;
            }
        }
        return std::nullopt;
    }

    bool has_payload(const WindowState& state) {
        return !std::holds_alternative<std::monostate>(state.payload);
    }

    std::optional<ExportTemplate> auto_template_for(WindowType type, const WindowPayload& payload) {
        switch (type) {
            case WindowType::kTabular:
                if (std::holds_alternative<TabularData>(payload)) {
                    return ExportTemplate::kPandas;
                }
                break;
            case WindowType::kChart:
                if (std::holds_alternative<ChartData>(payload)) {
                    return ExportTemplate::kMatplotlib;
                }
                break;
            case WindowType::kSpatialEditor:
            case WindowType::kPointCloud:
                if (std::holds_alternative<PointCloudData>(payload)) {
                    return ExportTemplate::kCustom;
                }
                break;
            case WindowType::kModel3D:
                if (std::holds_alternative<ModelData>(payload)) {
                    return ExportTemplate::kCustom;
                }
                break;
            case WindowType::kVolumetric: break;
        }
        return std::nullopt;
    }

} // namespace spatialbook
