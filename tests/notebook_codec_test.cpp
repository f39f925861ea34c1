#include <chrono>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "spatialbook/notebook_codec.hpp"

namespace {

    constexpr std::chrono::seconds kSampleEpoch{1714566645};

    spatialbook::CodecOptions      fixed_clock() {
        return spatialbook::CodecOptions{.clock = [] { return spatialbook::Timestamp(kSampleEpoch); }};
    }

    spatialbook::WindowRecord make_record(int id, spatialbook::WindowType type) {
        spatialbook::WindowRecord record;
        record.id                  = id;
        record.type                = type;
        record.created_at          = spatialbook::Timestamp(kSampleEpoch);
        record.state.last_modified = spatialbook::Timestamp(kSampleEpoch);
        return record;
    }

    nlohmann::json window_cell(const nlohmann::json& window_type, int window_id) {
        return {
            {"cell_type", "code"},
            {"metadata", {{"window_type", window_type}, {"window_id", window_id}}},
            {"source", {"print('x')\n"}},
            {"outputs", nlohmann::json::array()},
            {"execution_count", nullptr},
        };
    }

}

TEST(NotebookCodec, ExportWritesNotebookShell) {
    const spatialbook::NotebookCodec codec(fixed_clock());
    const auto                       document = nlohmann::json::parse(codec.export_records({}));

    EXPECT_TRUE(document.at("cells").empty());
    EXPECT_EQ(document.at("nbformat"), 4);
    EXPECT_EQ(document.at("nbformat_minor"), 5);
    EXPECT_EQ(document.at("metadata").at("kernelspec").at("name"), "python3");
    EXPECT_EQ(document.at("metadata").at("language_info").at("file_extension"), ".py");

    const auto& summary = document.at("metadata").at("visionos_export");
    EXPECT_EQ(summary.at("total_windows"), 0);
    EXPECT_EQ(summary.at("export_date"), "2024-05-01T12:30:45Z");
    EXPECT_EQ(summary.at("created_by"), "spatialbook");
    EXPECT_FALSE(document.at("metadata").contains("workspace_metadata"));
}

TEST(NotebookCodec, ExportOrdersCellsByIdAndAggregates) {
    const spatialbook::NotebookCodec codec(fixed_clock());
    auto                             chart = make_record(9, spatialbook::WindowType::kChart);
    chart.state.tags                       = {"b", "a"};
    auto note                              = make_record(2, spatialbook::WindowType::kSpatialEditor);
    note.state.export_template             = spatialbook::ExportTemplate::kMarkdown;
    note.state.tags                        = {"a"};

    const auto document = codec.export_json({chart, note});
    const auto& cells   = document.at("cells");

    ASSERT_EQ(cells.size(), 2u);
    EXPECT_EQ(cells.at(0).at("metadata").at("window_id"), 2);
    EXPECT_EQ(cells.at(0).at("cell_type"), "markdown");
    EXPECT_FALSE(cells.at(0).contains("outputs"));
    EXPECT_EQ(cells.at(1).at("cell_type"), "code");
    EXPECT_TRUE(cells.at(1).at("execution_count").is_null());
    EXPECT_EQ(cells.at(1).at("metadata").at("window_type"), "Charts");

    const auto& summary = document.at("metadata").at("visionos_export");
    EXPECT_EQ(summary.at("total_windows"), 2);
    EXPECT_EQ(summary.at("all_tags"), (nlohmann::json{"a", "b"}));
    EXPECT_EQ(summary.at("window_types"), (nlohmann::json{"Charts", "Spatial Editor"}));
}

TEST(NotebookCodec, RoundTripPreservesStructure) {
    const spatialbook::NotebookCodec codec(fixed_clock());
    auto                             table = make_record(1, spatialbook::WindowType::kTabular);
    table.position                         = spatialbook::WindowPosition{.x = 1, .y = 2, .z = 3, .width = 400, .height = 300};
    table.state.tags                       = {"a", "b"};
    table.state.export_template            = spatialbook::ExportTemplate::kPandas;
    table.state.payload = spatialbook::TabularData{.columns = {"name", "score"}, .rows = {{"a", "1"}, {"b", "2"}}, .dtypes = {}};

    auto note                              = make_record(2, spatialbook::WindowType::kSpatialEditor);
    note.state.content                     = "remember the milk";

    const auto imported = codec.parse_document(codec.export_records({table, note}), 1);

    ASSERT_TRUE(imported.has_value());
    ASSERT_EQ(imported->restored.size(), 2u);
    EXPECT_TRUE(imported->errors.empty());

    const auto& restored = imported->restored.at(0);
    EXPECT_EQ(restored.type, spatialbook::WindowType::kTabular);
    EXPECT_EQ(restored.position, table.position);
    EXPECT_EQ(restored.state.tags, table.state.tags);
    EXPECT_EQ(restored.state.export_template, spatialbook::ExportTemplate::kPandas);
    EXPECT_EQ(restored.state.payload, table.state.payload);
    EXPECT_EQ(restored.created_at, table.created_at);

    EXPECT_EQ(imported->restored.at(1).state.content, "remember the milk");
    ASSERT_TRUE(imported->original_metadata.has_value());
    EXPECT_EQ(imported->original_metadata->total_windows, 2);
}

TEST(NotebookCodec, ImportAllocatesFreshIds) {
    const spatialbook::NotebookCodec codec(fixed_clock());
    spatialbook::WindowRegistry      registry;
    registry.create(spatialbook::WindowType::kChart, 1);
    registry.create(spatialbook::WindowType::kChart, 2);
    registry.create(spatialbook::WindowType::kChart, 5);

    const auto document = codec.export_records({make_record(1, spatialbook::WindowType::kChart), make_record(2, spatialbook::WindowType::kTabular)});
    const auto imported = codec.import_document(document, registry);

    ASSERT_TRUE(imported.has_value());
    ASSERT_EQ(imported->restored.size(), 2u);
    EXPECT_EQ(imported->restored.at(0).id, 6);
    EXPECT_EQ(imported->restored.at(1).id, 7);
    EXPECT_EQ(imported->id_mapping, (std::map<int, int>{{1, 6}, {2, 7}}));
    EXPECT_EQ(registry.size(), 5u);
    EXPECT_TRUE(registry.get(7).has_value());
    EXPECT_FALSE(registry.is_open(7));
}

TEST(NotebookCodec, LongSingleWordContentImports) {
    const spatialbook::NotebookCodec codec(fixed_clock());
    auto                             record = make_record(1, spatialbook::WindowType::kVolumetric);
    record.state.content                    = std::string(200000, 'x');

    const auto                       document = codec.export_records({record});
    spatialbook::WindowRegistry      registry;
    const auto                       imported = codec.import_document(document, registry);

    ASSERT_TRUE(imported.has_value());
    EXPECT_TRUE(imported->errors.empty());
    ASSERT_EQ(imported->restored.size(), 1u);
    EXPECT_EQ(imported->restored.at(0).state.content, record.state.content);
}

TEST(NotebookCodec, MalformedCellIsReportedAndOthersRestored) {
    const spatialbook::NotebookCodec codec(fixed_clock());
    const nlohmann::json             document = {
        {"cells", {window_cell("Charts", 1), window_cell(42, 2), window_cell("Point Cloud Viewer", 3)}},
        {"metadata", nlohmann::json::object()},
    };

    const auto imported = codec.parse_document(document.dump(), 1);

    ASSERT_TRUE(imported.has_value());
    EXPECT_EQ(imported->restored.size(), 2u);
    ASSERT_EQ(imported->errors.size(), 1u);
    EXPECT_EQ(imported->errors.front().kind, spatialbook::ImportErrorKind::kMalformedMetadata);
    EXPECT_EQ(imported->errors.front().cell_index, std::optional<size_t>(1));
    EXPECT_EQ(spatialbook::format_import_error(imported->errors.front()), "cell 1: window_type is not a string");
}

TEST(NotebookCodec, NonTextSourceFailsOnlyThatCell) {
    const spatialbook::NotebookCodec codec(fixed_clock());
    auto                             broken = window_cell("Charts", 1);
    broken["source"]                        = {1, 2};
    const nlohmann::json document           = {{"cells", {broken, window_cell("Charts", 2)}}};

    const auto imported = codec.parse_document(document.dump(), 10);

    ASSERT_TRUE(imported.has_value());
    ASSERT_EQ(imported->restored.size(), 1u);
    EXPECT_EQ(imported->restored.front().id, 10);
    ASSERT_EQ(imported->errors.size(), 1u);
    EXPECT_EQ(imported->errors.front().kind, spatialbook::ImportErrorKind::kCellFailed);
}

TEST(NotebookCodec, SkipsForeignAndUnknownCells) {
    const spatialbook::NotebookCodec codec(fixed_clock());
    const nlohmann::json             document = {
        {"cells",
         {
             {{"cell_type", "markdown"}, {"metadata", nlohmann::json::object()}, {"source", "# Title"}},
             window_cell("Hologram", 4),
             "not a cell",
             window_cell("3D Model Viewer", 5),
         }},
    };

    const auto imported = codec.parse_document(document.dump(), 1);

    ASSERT_TRUE(imported.has_value());
    ASSERT_EQ(imported->restored.size(), 1u);
    EXPECT_EQ(imported->restored.front().type, spatialbook::WindowType::kModel3D);
    EXPECT_TRUE(imported->errors.empty());
    EXPECT_FALSE(imported->original_metadata.has_value());
}

TEST(NotebookCodec, FatalErrorsProduceNoRecords) {
    const spatialbook::NotebookCodec codec(fixed_clock());
    spatialbook::WindowRegistry      registry;

    const auto invalid = codec.import_document("{not json", registry);
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().kind, spatialbook::ImportErrorKind::kInvalidJson);

    const auto missing = codec.import_document(R"({"metadata": {}})", registry);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, spatialbook::ImportErrorKind::kMissingCells);

    EXPECT_EQ(registry.size(), 0u);
}

TEST(NotebookCodec, WorkspaceBlockRoundTrips) {
    const spatialbook::NotebookCodec   codec(fixed_clock());
    spatialbook::WorkspaceDocumentInfo info;
    info.id            = "ABC";
    info.name          = "Lab";
    info.category      = "Research";
    info.is_template   = true;
    info.created_date  = spatialbook::Timestamp(kSampleEpoch);
    info.modified_date = spatialbook::Timestamp(kSampleEpoch);
    info.tags          = {"x"};

    const auto analysis = codec.analyze(codec.export_records({make_record(3, spatialbook::WindowType::kVolumetric)}, info));

    ASSERT_TRUE(analysis.has_value());
    EXPECT_TRUE(analysis->is_native());
    EXPECT_EQ(analysis->window_cells, 1u);
    EXPECT_EQ(analysis->window_types, (std::vector<spatialbook::WindowType>{spatialbook::WindowType::kVolumetric}));
    ASSERT_TRUE(analysis->workspace.has_value());
    EXPECT_EQ(analysis->workspace->name, "Lab");
    EXPECT_TRUE(analysis->workspace->is_template);
    EXPECT_EQ(analysis->workspace->created_date, info.created_date);
}

TEST(NotebookCodec, ValidateReportsReason) {
    const spatialbook::NotebookCodec codec;
    std::string                      error;

    EXPECT_TRUE(codec.validate(R"({"cells": []})", &error));
    EXPECT_TRUE(error.empty());
    EXPECT_FALSE(codec.validate("[]", &error));
    EXPECT_EQ(error, "document has no cells array");
}
