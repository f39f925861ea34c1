#include <gtest/gtest.h>

#include "spatialbook/content_generators.hpp"
#include "spatialbook/payload_extractors.hpp"

namespace {

    const spatialbook::PayloadExtractors& extractors() {
        static const auto instance = spatialbook::PayloadExtractors::with_default_matchers();
        return instance;
    }

    template <typename T>
    std::optional<T> extract_as(spatialbook::WindowType type, const std::string& source) {
        const auto payload = extractors().extract(type, source);
        if (!payload || !std::holds_alternative<T>(*payload)) {
            return std::nullopt;
        }
        return std::get<T>(*payload);
    }

}

TEST(PayloadExtractors, RecoversGeneratedTable) {
    const spatialbook::TabularData table{
        .columns = {"name", "score"},
        .rows    = {{"o'brien", "1"}, {"b", "2"}},
        .dtypes  = {{"score", "int"}},
    };

    const auto recovered = extract_as<spatialbook::TabularData>(spatialbook::WindowType::kTabular, spatialbook::generate_tabular_code(table));

    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, table);
}

TEST(PayloadExtractors, RecoversGeneratedChart) {
    const spatialbook::ChartData chart{
        .title      = "Revenue",
        .chart_type = "bar",
        .x_label    = "Month",
        .y_label    = "USD",
        .x_data     = {1.0, 2.0, 3.0},
        .y_data     = {4.5, -5.0, 6.25},
    };

    const auto recovered = extract_as<spatialbook::ChartData>(spatialbook::WindowType::kChart, spatialbook::generate_chart_code(chart));

    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, chart);
}

TEST(PayloadExtractors, RecoversGeneratedPointCloud) {
    spatialbook::PointCloudData cloud;
    cloud.title      = "Scan";
    cloud.demo_type  = "sphere";
    cloud.parameters = {{"radius", 2.5}};
    cloud.points     = {{.x = 0.0, .y = 1.0, .z = 2.0, .intensity = 0.25}, {.x = 3.0, .y = 4.0, .z = 5.0, .intensity = 0.75}};

    const auto recovered = extract_as<spatialbook::PointCloudData>(spatialbook::WindowType::kSpatialEditor, spatialbook::generate_point_cloud_code(cloud));

    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, cloud);
}

TEST(PayloadExtractors, RecoversGeneratedMetrics) {
    spatialbook::VolumeMetrics metrics;
    metrics.title    = "Render stats";
    metrics.category = "gpu";
    metrics.metrics  = {{"fps", 60.0}, {"latency", 12.5}};
    metrics.unit     = "ms";

    const auto recovered = extract_as<spatialbook::VolumeMetrics>(spatialbook::WindowType::kVolumetric, spatialbook::generate_volume_code(metrics));

    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, metrics);
}

TEST(PayloadExtractors, RecoversGeneratedModel) {
    spatialbook::ModelData model;
    model.title      = "Unit cube";
    model.model_type = "cube";
    model.scale      = 2.0;
    model.position   = {.x = 1.0, .y = 0.0, .z = -1.0};
    model.vertices   = {{.x = 0.0, .y = 0.0, .z = 0.0}, {.x = 1.0, .y = 0.0, .z = 0.0}, {.x = 1.0, .y = 1.0, .z = 0.0}};
    model.faces      = {{.indices = {0, 1, 2}}};
    model.materials  = {{.name = "Default", .color = "red"}};

    const auto recovered = extract_as<spatialbook::ModelData>(spatialbook::WindowType::kModel3D, spatialbook::generate_model_code(model));

    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, model);
}

TEST(PayloadExtractors, ReadsHandWrittenPointsDictionary) {
    const std::string source = "# Lidar sweep\npoints_data = {'x': [1, 2], 'y': [3, 4], 'z': [5, 6]}\n";

    const auto        cloud  = extract_as<spatialbook::PointCloudData>(spatialbook::WindowType::kPointCloud, source);

    ASSERT_TRUE(cloud.has_value());
    EXPECT_EQ(cloud->title, "Lidar sweep");
    ASSERT_EQ(cloud->points.size(), 2u);
    EXPECT_DOUBLE_EQ(cloud->points[1].z, 6.0);
}

TEST(PayloadExtractors, FallsBackToNumericAssignments) {
    const std::string source = "# Throughput\nrequests = 120\nerrors = 3.5\nname = 'x'\n";

    const auto        metrics = extract_as<spatialbook::VolumeMetrics>(spatialbook::WindowType::kVolumetric, source);

    ASSERT_TRUE(metrics.has_value());
    EXPECT_EQ(metrics->title, "Throughput");
    EXPECT_EQ(metrics->metrics.size(), 2u);
    EXPECT_DOUBLE_EQ(metrics->metrics.at("errors"), 3.5);
}

TEST(PayloadExtractors, NoMarkerMeansNoPayload) {
    EXPECT_FALSE(extractors().extract(spatialbook::WindowType::kChart, "print('hello')").has_value());
    EXPECT_FALSE(extractors().matching_matcher(spatialbook::WindowType::kChart, "print('hello')").has_value());
}

TEST(PayloadExtractors, MalformedBodyYieldsNoPayload) {
    const std::string source = "x_data = np.array([1, 2, oops])\ny_data = np.array([1, 2, 3])\n";

    EXPECT_EQ(extractors().matching_matcher(spatialbook::WindowType::kChart, source), "named-arrays");
    EXPECT_FALSE(extractors().extract(spatialbook::WindowType::kChart, source).has_value());
}

TEST(PayloadExtractors, FirstRegisteredMatcherWins) {
    spatialbook::PayloadExtractors custom;
    custom.add_matcher(spatialbook::WindowType::kVolumetric,
                       {"first", std::regex("score"), [](std::string_view, size_t) -> std::optional<spatialbook::WindowPayload> {
                            return spatialbook::VolumeMetrics{.title = "first"};
                        }});
    custom.add_matcher(spatialbook::WindowType::kVolumetric,
                       {"second", std::regex("score"), [](std::string_view, size_t) -> std::optional<spatialbook::WindowPayload> {
                            return spatialbook::VolumeMetrics{.title = "second"};
                        }});

    const auto payload = custom.extract(spatialbook::WindowType::kVolumetric, "score = 1");

    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(std::get<spatialbook::VolumeMetrics>(*payload).title, "first");
    EXPECT_EQ(custom.matcher_count(spatialbook::WindowType::kVolumetric), 2u);
    EXPECT_EQ(custom.matcher_count(spatialbook::WindowType::kChart), 0u);
}

TEST(PayloadExtractors, LongUnbrokenTokensAreScannedSafely) {
    const std::string word(200000, 'a');

    EXPECT_FALSE(extractors().extract(spatialbook::WindowType::kVolumetric, "# Volume Metrics\n" + word).has_value());
    EXPECT_FALSE(extractors().extract(spatialbook::WindowType::kChart, "x_data" + std::string(200000, ' ') + "= [1]").has_value());

    const auto metrics = extract_as<spatialbook::VolumeMetrics>(spatialbook::WindowType::kVolumetric, word + "\nlatency = 12.5\n");
    ASSERT_TRUE(metrics.has_value());
    EXPECT_DOUBLE_EQ(metrics->metrics.at("latency"), 12.5);
}

TEST(PayloadExtractors, DropsFacesWithUnusableIndices) {
    const std::string source = "vertices = [[0, 0, 0], [1, 0, 0], [0, 1, 0]]\n"
                               "faces = [[1e300, 1, 2], [0, 1, 2], [0.5, 1, 2], [-1, 0, 1], [inf, 0, 1]]\n";

    const auto        model  = extract_as<spatialbook::ModelData>(spatialbook::WindowType::kModel3D, source);

    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(model->vertices.size(), 3u);
    ASSERT_EQ(model->faces.size(), 1u);
    EXPECT_EQ(model->faces[0].indices, (std::vector<int>{0, 1, 2}));
}
