#include <gtest/gtest.h>

#include "spatialbook/types.hpp"

TEST(WindowTypeNames, RoundTripDisplayNames) {
    for (const auto type : spatialbook::all_window_types()) {
        EXPECT_EQ(spatialbook::parse_window_type(spatialbook::window_type_name(type)), type);
    }
    EXPECT_EQ(spatialbook::window_type_name(spatialbook::WindowType::kVolumetric), "Model Metric Viewer");
    EXPECT_FALSE(spatialbook::parse_window_type("charts").has_value());
}

TEST(ExportTemplateNames, ParsesKnownNamesOnly) {
    EXPECT_EQ(spatialbook::parse_export_template("Seaborn Statistical"), spatialbook::ExportTemplate::kSeaborn);
    EXPECT_EQ(spatialbook::export_template_name(spatialbook::ExportTemplate::kMarkdown), "Markdown Only");
    EXPECT_FALSE(spatialbook::parse_export_template("Excel").has_value());
}

TEST(AutoTemplate, FollowsPayloadKind) {
    EXPECT_EQ(spatialbook::auto_template_for(spatialbook::WindowType::kTabular, spatialbook::TabularData{}), spatialbook::ExportTemplate::kPandas);
    EXPECT_EQ(spatialbook::auto_template_for(spatialbook::WindowType::kChart, spatialbook::ChartData{}), spatialbook::ExportTemplate::kMatplotlib);
    EXPECT_EQ(spatialbook::auto_template_for(spatialbook::WindowType::kPointCloud, spatialbook::PointCloudData{}), spatialbook::ExportTemplate::kCustom);
    EXPECT_FALSE(spatialbook::auto_template_for(spatialbook::WindowType::kVolumetric, spatialbook::VolumeMetrics{}).has_value());
    EXPECT_FALSE(spatialbook::auto_template_for(spatialbook::WindowType::kChart, spatialbook::TabularData{}).has_value());
}

TEST(WindowState, PayloadPresence) {
    spatialbook::WindowState state;
    EXPECT_FALSE(spatialbook::has_payload(state));
    state.payload = spatialbook::ChartData{};
    EXPECT_TRUE(spatialbook::has_payload(state));
}
