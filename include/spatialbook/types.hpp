#ifndef SPATIALBOOK_TYPES_HPP
#define SPATIALBOOK_TYPES_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "spatialbook/time_utils.hpp"

namespace spatialbook {

    enum class WindowType {
        kChart,
        kSpatialEditor,
        kTabular,
        kVolumetric,
        kPointCloud,
        kModel3D,
    };

    enum class ExportTemplate {
        kPlain,
        kMatplotlib,
        kPandas,
        kNumpy,
        kPlotly,
        kSeaborn,
        kCustom,
        kMarkdown,
    };

    // Wire names as they appear in document metadata.
    std::string_view              window_type_name(WindowType type);
    std::optional<WindowType>     parse_window_type(std::string_view value);
    std::string_view              export_template_name(ExportTemplate value);
    std::optional<ExportTemplate> parse_export_template(std::string_view value);
    const std::vector<WindowType>& all_window_types();

    struct WindowPosition {
        double                x      = 0.0;
        double                y      = 0.0;
        double                z      = 0.0;
        double                width  = 400.0;
        double                height = 300.0;
        std::optional<double> depth  = std::nullopt;

        bool                  operator==(const WindowPosition&) const = default;
    };

    struct TabularData {
        std::vector<std::string>              columns;
        std::vector<std::vector<std::string>> rows;
        std::map<std::string, std::string>    dtypes;

        bool                                  operator==(const TabularData&) const = default;
    };

    struct ChartData {
        std::string                title      = "Chart Data";
        std::string                chart_type = "line";
        std::string                x_label    = "X";
        std::string                y_label    = "Y";
        std::vector<double>        x_data;
        std::vector<double>        y_data;
        std::optional<std::string> color;
        std::optional<std::string> style;

        bool                       operator==(const ChartData&) const = default;
    };

    struct PointSample {
        double                x = 0.0;
        double                y = 0.0;
        double                z = 0.0;
        std::optional<double> intensity;

        bool                  operator==(const PointSample&) const = default;
    };

    struct PointCloudData {
        std::string                   title     = "Point Cloud";
        std::string                   x_label   = "X";
        std::string                   y_label   = "Y";
        std::string                   z_label   = "Z";
        std::string                   demo_type = "custom";
        std::map<std::string, double> parameters;
        std::vector<PointSample>      points;

        bool                          operator==(const PointCloudData&) const = default;
    };

    struct VolumeMetrics {
        std::string                   title    = "Volume Metrics";
        std::string                   category = "performance";
        std::map<std::string, double> metrics;
        std::optional<std::string>    unit;

        bool                          operator==(const VolumeMetrics&) const = default;
    };

    struct Vec3 {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;

        bool   operator==(const Vec3&) const = default;
    };

    struct ModelFace {
        std::vector<int>           indices;
        std::optional<std::string> material;

        bool                       operator==(const ModelFace&) const = default;
    };

    struct ModelMaterial {
        std::string name;
        std::string color     = "gray";
        double      metallic  = 0.0;
        double      roughness = 0.5;

        bool        operator==(const ModelMaterial&) const = default;
    };

    struct ModelData {
        std::string                title      = "3D Model";
        std::string                model_type = "mesh";
        double                     scale      = 1.0;
        Vec3                       position;
        Vec3                       rotation;
        std::vector<Vec3>          vertices;
        std::vector<ModelFace>     faces;
        std::vector<ModelMaterial> materials;

        bool                       operator==(const ModelData&) const = default;
    };

    // At most one payload per window.
    using WindowPayload = std::variant<std::monostate, TabularData, ChartData, PointCloudData, VolumeMetrics, ModelData>;

    struct WindowState {
        bool                     minimized       = false;
        bool                     maximized       = false;
        double                   opacity         = 1.0;
        std::string              content;
        ExportTemplate           export_template = ExportTemplate::kPlain;
        std::vector<std::string> tags;
        Timestamp                last_modified;
        WindowPayload            payload;
    };

    struct WindowRecord {
        int            id   = 0;
        WindowType     type = WindowType::kChart;
        WindowPosition position;
        WindowState    state;
        Timestamp      created_at;
    };

    bool                          has_payload(const WindowState& state);

    // Template picked the first time a payload lands on a window still using the plain template.
    std::optional<ExportTemplate> auto_template_for(WindowType type, const WindowPayload& payload);

} // namespace spatialbook

#endif // SPATIALBOOK_TYPES_HPP
