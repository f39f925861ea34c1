#ifndef SPATIALBOOK_CONTENT_GENERATORS_HPP
#define SPATIALBOOK_CONTENT_GENERATORS_HPP

#include <string>
#include <string_view>

#include "spatialbook/types.hpp"

namespace spatialbook {

    // Pure and deterministic: identical payloads produce byte-identical text. Empty payloads yield a
    // labelled placeholder.
    std::string generate_tabular_code(const TabularData& data);
    std::string generate_chart_code(const ChartData& data);
    std::string generate_point_cloud_code(const PointCloudData& data);
    std::string generate_volume_code(const VolumeMetrics& data);
    std::string generate_model_code(const ModelData& data);

    // Payload code when the record carries a payload matching its window type, otherwise a header
    // describing the window followed by its free-text content.
    std::string generate_cell_source(const WindowRecord& record);
    std::string generate_fallback_source(const WindowRecord& record);

    // Removes the header written by generate_fallback_source, leaving the free-text content.
    std::string strip_fallback_header(std::string_view source);

    std::string python_string_literal(std::string_view value);

} // namespace spatialbook

#endif // SPATIALBOOK_CONTENT_GENERATORS_HPP
