#include <chrono>
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "spatialbook/file_io.hpp"
#include "spatialbook/runtime.hpp"

namespace {

    class RuntimeTest : public ::testing::Test {
      protected:
        void SetUp() override {
            dir_ = std::filesystem::temp_directory_path() /
                ("spatialbook-runtime-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
            std::filesystem::create_directories(dir_);
        }

        void TearDown() override {
            std::filesystem::remove_all(dir_);
        }

        spatialbook::WorkspaceMetadataStore make_store() {
            return spatialbook::WorkspaceMetadataStore(spatialbook::WorkspaceStoreOptions{
                .index_path     = dir_ / "workspace_metadata.json",
                .workspaces_dir = dir_ / "Workspaces",
                .open_delay     = std::chrono::milliseconds(0),
            });
        }

        spatialbook::CommandOutput run(spatialbook::WorkspaceMetadataStore& store, std::vector<std::string> args) {
            return spatialbook::run_command_line(store, codec_, args);
        }

        std::filesystem::path      dir_;
        spatialbook::NotebookCodec codec_;
    };

}

TEST_F(RuntimeTest, CreateFromDocumentThenListAndShow) {
    spatialbook::WindowRegistry registry;
    registry.create(spatialbook::WindowType::kChart);
    registry.create(spatialbook::WindowType::kTabular);
    const auto document = dir_ / "source.ipynb";
    ASSERT_FALSE(spatialbook::write_text_file_atomic(document, codec_.export_document(registry)).has_value());
    auto store = make_store();

    const auto created = run(store, {"create", "Sales", "--from", document.string(), "--description", "numbers"});
    ASSERT_TRUE(created.success) << created.output;

    const auto listed = run(store, {"list"});
    ASSERT_TRUE(listed.success);
    EXPECT_EQ(listed.output.rfind("Sales\tCustom\t2 windows\t", 0), 0u);

    const auto shown = run(store, {"show", "Sales"});
    ASSERT_TRUE(shown.success);
    EXPECT_NE(shown.output.find("description: numbers"), std::string::npos);
    EXPECT_NE(shown.output.find("window types: Charts, DataFrame Viewer"), std::string::npos);
}

TEST_F(RuntimeTest, DuplicateNameFails) {
    auto store = make_store();
    ASSERT_TRUE(run(store, {"create", "Demo"}).success);

    const auto again = run(store, {"create", "Demo"});

    EXPECT_FALSE(again.success);
    EXPECT_EQ(again.output, "a workspace with this name already exists: Demo");
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(RuntimeTest, TemplatesDuplicateAndDelete) {
    auto store = make_store();
    ASSERT_TRUE(run(store, {"create", "Starter", "--template"}).success);

    const auto templates = run(store, {"list", "templates"});
    EXPECT_NE(templates.output.find("Starter\tTemplate"), std::string::npos);

    ASSERT_TRUE(run(store, {"duplicate", "Starter"}).success);
    const auto custom = run(store, {"list", "custom"});
    EXPECT_EQ(custom.output.rfind("Starter Copy\tCustom", 0), 0u);

    EXPECT_TRUE(run(store, {"delete", "Starter"}).success);
    EXPECT_FALSE(run(store, {"show", "Starter"}).success);
    EXPECT_EQ(run(store, {"delete", "Starter"}).output, "workspace not found: Starter");
}

TEST_F(RuntimeTest, InspectReportsDocumentShape) {
    spatialbook::WindowRegistry registry;
    const auto                  record = registry.create(spatialbook::WindowType::kPointCloud);
    registry.add_tag(record.id, "lidar");
    const auto document = dir_ / "cloud.ipynb";
    ASSERT_FALSE(spatialbook::write_text_file_atomic(document, codec_.export_document(registry)).has_value());
    auto store = make_store();

    const auto inspected = run(store, {"inspect", document.string()});

    ASSERT_TRUE(inspected.success) << inspected.output;
    EXPECT_NE(inspected.output.find("format: spatialbook export"), std::string::npos);
    EXPECT_NE(inspected.output.find("window types: Point Cloud Viewer"), std::string::npos);
    EXPECT_NE(inspected.output.find("tags: lidar"), std::string::npos);

    ASSERT_FALSE(spatialbook::write_text_file_atomic(document, "{}").has_value());
    const auto rejected = run(store, {"inspect", document.string()});
    EXPECT_FALSE(rejected.success);
    EXPECT_EQ(rejected.output, "document has no cells array");
}

TEST_F(RuntimeTest, RefreshAndSearch) {
    auto store = make_store();
    ASSERT_TRUE(run(store, {"create", "Alpha", "--description", "Orbital data"}).success);

    EXPECT_EQ(run(store, {"refresh"}).output, "refreshed 0 of 1 workspaces");
    EXPECT_EQ(run(store, {"search", "ORBITAL"}).output.rfind("Alpha\t", 0), 0u);
    EXPECT_TRUE(run(store, {"search", "nothing"}).output.empty());
    EXPECT_EQ(run(store, {"bogus"}).output, "unknown command");
}
