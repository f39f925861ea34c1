#ifndef SPATIALBOOK_PAYLOAD_EXTRACTORS_HPP
#define SPATIALBOOK_PAYLOAD_EXTRACTORS_HPP

#include <functional>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "spatialbook/types.hpp"

namespace spatialbook {

    // Rebuilds a payload from cell source text. `match_end` is the offset just past the marker match.
    using PayloadReconstructor = std::function<std::optional<WindowPayload>(std::string_view source, size_t match_end)>;

    struct PayloadMatcher {
        std::string          name;
        std::regex           marker;
        PayloadReconstructor reconstruct;
    };

    // Best-effort recovery of payloads from generated code. Matchers are tried in registration order
    // for the cell's window type; the first whose marker matches decides the outcome.
    class PayloadExtractors {
      public:
        static PayloadExtractors     with_default_matchers();

        void                         add_matcher(WindowType type, PayloadMatcher matcher);
        std::optional<WindowPayload> extract(WindowType type, const std::string& source) const;
        // Name of the matcher whose marker fires first, for diagnostics.
        std::optional<std::string>   matching_matcher(WindowType type, const std::string& source) const;
        size_t                       matcher_count(WindowType type) const;

      private:
        const PayloadMatcher*                           find_match(WindowType type, const std::string& source, size_t* match_end) const;

        std::map<WindowType, std::vector<PayloadMatcher>> matchers_;
    };

    std::optional<TabularData>    extract_tabular_dict(std::string_view source, size_t body_start);
    std::optional<ChartData>      extract_chart_arrays(std::string_view source, std::string_view x_name, std::string_view y_name);
    std::optional<PointCloudData> extract_point_arrays(std::string_view source);
    std::optional<VolumeMetrics>  extract_metrics_dict(std::string_view source, size_t body_start);
    std::optional<ModelData>      extract_model_arrays(std::string_view source, size_t vertices_start);

} // namespace spatialbook

#endif // SPATIALBOOK_PAYLOAD_EXTRACTORS_HPP
