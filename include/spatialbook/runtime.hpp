#ifndef SPATIALBOOK_RUNTIME_HPP
#define SPATIALBOOK_RUNTIME_HPP

#include <string>
#include <string_view>
#include <vector>

#include "spatialbook/command.hpp"
#include "spatialbook/config.hpp"
#include "spatialbook/notebook_codec.hpp"
#include "spatialbook/paths.hpp"
#include "spatialbook/workspace_metadata_store.hpp"

namespace spatialbook {

    struct RuntimeConfig {
        Paths  paths;
        Config config;
    };

    struct CommandOutput {
        bool        success;
        std::string output;
    };

    std::string   render_workspace_list(const std::vector<WorkspaceRecord>& records);
    std::string   render_workspace_details(const WorkspaceRecord& record);
    std::string   render_document_analysis(const DocumentAnalysis& analysis);

    CommandOutput run_command(WorkspaceMetadataStore& store, const NotebookCodec& codec, const Command& command);
    CommandOutput run_command_line(WorkspaceMetadataStore& store, const NotebookCodec& codec, const std::vector<std::string>& args);

} // namespace spatialbook

#endif // SPATIALBOOK_RUNTIME_HPP
