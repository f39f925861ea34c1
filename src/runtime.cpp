#include "spatialbook/runtime.hpp"

#include <filesystem>

#include "spatialbook/file_io.hpp"
#include "spatialbook/strings.hpp"

namespace spatialbook {

    namespace {

        std::string join_names(const std::vector<std::string>& values) {
            std::string text;
            for (const auto& value : values) {
                if (!text.empty()) {
                    text.append(", ");
                }
                text.append(value);
            }
            return text.empty() ? "-" : text;
        }

        CommandOutput workspace_failure(const WorkspaceError& error) {
            return CommandOutput{false, format_workspace_error(error)};
        }

        CommandOutput create_workspace(WorkspaceMetadataStore& store, const NotebookCodec& codec, const Command& command) {
            WindowRegistry registry;
            std::string    note;
            if (command.document_path) {
                const auto text = read_text_file(*command.document_path);
                if (!text) {
                    return CommandOutput{false, "unable to read " + *command.document_path};
                }
                const auto imported = codec.import_document(*text, registry);
                if (!imported) {
                    return CommandOutput{false, format_import_error(imported.error())};
                }
                if (!imported->errors.empty()) {
                    note = "\n" + std::to_string(imported->errors.size()) + " cells could not be restored";
                }
            }

            CreateWorkspaceRequest request;
            request.name        = command.name.value_or("");
            request.description = command.description;
            request.category    = command.category.value_or(command.is_template ? WorkspaceCategory::kTemplate : WorkspaceCategory::kCustom);
            request.is_template = command.is_template;
            const auto created  = store.create(request, registry);
            if (!created) {
                return workspace_failure(created.error());
            }
            return CommandOutput{true, render_workspace_details(*created) + note};
        }

    } // namespace

    std::string render_workspace_list(const std::vector<WorkspaceRecord>& records) {
        std::string output;
        for (const auto& record : records) {
            if (!output.empty()) {
                output.push_back('\n');
            }
            output.append(record.name);
            output.append("\t");
            output.append(workspace_category_name(record.category));
            output.append("\t");
            output.append(std::to_string(record.total_windows) + (record.total_windows == 1 ? " window" : " windows"));
            output.append("\t");
            output.append(format_iso8601(record.modified_date));
            if (record.is_template) {
                output.append("\ttemplate");
            }
        }
        return output;
    }

    std::string render_workspace_details(const WorkspaceRecord& record) {
        std::vector<std::string> lines = {
            "name: " + record.name,
            "id: " + record.id,
            "category: " + std::string(workspace_category_name(record.category)),
            std::string("template: ") + (record.is_template ? "yes" : "no"),
            "windows: " + std::to_string(record.total_windows),
            "window types: " + join_names(record.window_types),
            "tags: " + join_names(record.tags),
            "created: " + format_iso8601(record.created_date),
            "modified: " + format_iso8601(record.modified_date),
            "file: " + (record.file_path ? record.file_path->string() : std::string("-")),
        };
        if (!record.description.empty()) {
            lines.insert(lines.begin() + 1, "description: " + record.description);
        }
        return join_lines(lines);
    }

    std::string render_document_analysis(const DocumentAnalysis& analysis) {
        std::vector<std::string> kinds;
        for (const auto type : analysis.window_types) {
            kinds.emplace_back(window_type_name(type));
        }
        std::vector<std::string> lines = {
            std::string("format: ") + (analysis.is_native() ? "spatialbook export" : "plain notebook"),
            "cells: " + std::to_string(analysis.total_cells),
            "window cells: " + std::to_string(analysis.window_cells),
            "window types: " + join_names(kinds),
            "templates: " + join_names(analysis.export_templates),
            "tags: " + join_names(analysis.all_tags),
        };
        if (analysis.summary && analysis.summary->export_date) {
            lines.push_back("exported: " + format_iso8601(*analysis.summary->export_date));
        }
        if (analysis.workspace) {
            lines.push_back("workspace: " + analysis.workspace->name);
        }
        return join_lines(lines);
    }

    CommandOutput run_command(WorkspaceMetadataStore& store, const NotebookCodec& codec, const Command& command) {
        switch (command.kind) {
            case CommandKind::kList: {
                switch (command.list_filter) {
                    case ListFilter::kTemplates: return CommandOutput{true, render_workspace_list(store.templates())};
                    case ListFilter::kCustom: return CommandOutput{true, render_workspace_list(store.custom())};
                    case ListFilter::kAll: break;
                }
                return CommandOutput{true, render_workspace_list(store.all())};
            }
            case CommandKind::kSearch: {
                return CommandOutput{true, render_workspace_list(store.search(command.query.value_or("")))};
            }
            case CommandKind::kShow: {
                const auto record = store.find_by_name(command.name.value_or(""));
                if (!record) {
                    return CommandOutput{false, "workspace not found: " + command.name.value_or("")};
                }
                return CommandOutput{true, render_workspace_details(*record)};
            }
            case CommandKind::kRefresh: {
                const auto changed = store.refresh();
                return CommandOutput{true, "refreshed " + std::to_string(changed) + " of " + std::to_string(store.size()) + " workspaces"};
            }
            case CommandKind::kCreate: {
                return create_workspace(store, codec, command);
            }
            case CommandKind::kDelete: {
                const auto record = store.find_by_name(command.name.value_or(""));
                if (!record) {
                    return CommandOutput{false, "workspace not found: " + command.name.value_or("")};
                }
                const auto deleted = store.delete_workspace(record->id);
                if (!deleted) {
                    return workspace_failure(deleted.error());
                }
                return CommandOutput{true, "ok"};
            }
            case CommandKind::kDuplicate: {
                const auto record = store.find_by_name(command.name.value_or(""));
                if (!record) {
                    return CommandOutput{false, "workspace not found: " + command.name.value_or("")};
                }
                const auto copy = store.duplicate_workspace(record->id);
                if (!copy) {
                    return workspace_failure(copy.error());
                }
                return CommandOutput{true, render_workspace_details(*copy)};
            }
            case CommandKind::kInspect: {
                const auto path = command.document_path.value_or("");
                const auto text = read_text_file(path);
                if (!text) {
                    return CommandOutput{false, "unable to read " + path};
                }
                const auto analysis = codec.analyze(*text);
                if (!analysis) {
                    return CommandOutput{false, format_import_error(analysis.error())};
                }
                return CommandOutput{true, render_document_analysis(*analysis)};
            }
        }
        return CommandOutput{false, "unknown command"};
    }

    CommandOutput run_command_line(WorkspaceMetadataStore& store, const NotebookCodec& codec, const std::vector<std::string>& args) {
        const auto parsed = parse_command_tokens(args);
        if (std::holds_alternative<ParseError>(parsed)) {
            const auto error = std::get<ParseError>(parsed);
            return CommandOutput{false, error.message};
        }
        return run_command(store, codec, std::get<Command>(parsed));
    }

} // namespace spatialbook
