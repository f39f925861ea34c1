#include "spatialbook/notebook_codec.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include "spatialbook/content_generators.hpp"
#include "spatialbook/failsafe.hpp"
#include "spatialbook/json_utils.hpp"
#include "spatialbook/logging.hpp"
#include "spatialbook/strings.hpp"

namespace spatialbook {

    namespace {

        constexpr std::string_view kContext = "notebook codec";

        nlohmann::json kernelspec() {
            return {
                {"display_name", "Python 3"},
                {"language", "python"},
                {"name", "python3"},
            };
        }

        nlohmann::json language_info() {
            return {
                {"name", "python"},
                {"version", "3.8.0"},
                {"mimetype", "text/x-python"},
                {"codemirror_mode", {{"name", "ipython"}, {"version", 3}}},
                {"pygments_lexer", "ipython3"},
                {"nbconvert_exporter", "python"},
                {"file_extension", ".py"},
            };
        }

        nlohmann::json position_json(const WindowPosition& position) {
            nlohmann::json json = {
                {"x", position.x}, {"y", position.y}, {"z", position.z}, {"width", position.width}, {"height", position.height},
            };
            if (position.depth) {
                json["depth"] = *position.depth;
            }
            return json;
        }

        nlohmann::json cell_json(const WindowRecord& record) {
            const bool     markdown = record.state.export_template == ExportTemplate::kMarkdown;
            nlohmann::json metadata = {
                {"window_id", record.id},
                {"window_type", std::string(window_type_name(record.type))},
                {"export_template", std::string(export_template_name(record.state.export_template))},
                {"tags", record.state.tags},
                {"position", position_json(record.position)},
                {"state",
                 {
                     {"minimized", record.state.minimized},
                     {"maximized", record.state.maximized},
                     {"opacity", record.state.opacity},
                 }},
                {"timestamps",
                 {
                     {"created", format_iso8601(record.created_at)},
                     {"modified", format_iso8601(record.state.last_modified)},
                 }},
            };

            nlohmann::json cell = {
                {"cell_type", markdown ? "markdown" : "code"},
                {"metadata", std::move(metadata)},
                {"source", split_lines(generate_cell_source(record))},
            };
            if (!markdown) {
                cell["execution_count"] = nullptr;
                cell["outputs"]         = nlohmann::json::array();
            }
            return cell;
        }

        std::optional<ExportSummary> parse_summary(const nlohmann::json& metadata) {
            if (!metadata.is_object() || !metadata.contains(std::string(kAggregateBlockKey))) {
                return std::nullopt;
            }
            const auto& block = metadata.at(std::string(kAggregateBlockKey));
            if (!block.is_object()) {
                return std::nullopt;
            }
            ExportSummary summary;
            if (const auto date = optional_string_field(block, "export_date")) {
                summary.export_date = parse_iso8601(*date);
            }
            summary.total_windows    = optional_int_field(block, "total_windows").value_or(0);
            summary.window_types     = optional_string_array_field(block, "window_types").value_or(std::vector<std::string>{});
            summary.export_templates = optional_string_array_field(block, "export_templates").value_or(std::vector<std::string>{});
            summary.all_tags         = optional_string_array_field(block, "all_tags").value_or(std::vector<std::string>{});
            summary.created_by       = optional_string_field(block, "created_by").value_or("");
            summary.platform_version = optional_string_field(block, "platform_version").value_or("");
            return summary;
        }

        std::optional<WorkspaceDocumentInfo> parse_workspace(const nlohmann::json& metadata) {
            if (!metadata.is_object() || !metadata.contains(std::string(kWorkspaceBlockKey))) {
                return std::nullopt;
            }
            const auto& block = metadata.at(std::string(kWorkspaceBlockKey));
            if (!block.is_object()) {
                return std::nullopt;
            }
            WorkspaceDocumentInfo info;
            info.id          = optional_string_field(block, "id").value_or("");
            info.name        = optional_string_field(block, "name").value_or("");
            info.description = optional_string_field(block, "description").value_or("");
            info.category    = optional_string_field(block, "category").value_or("");
            info.is_template = optional_bool_field(block, "is_template").value_or(false);
            info.tags        = optional_string_array_field(block, "tags").value_or(std::vector<std::string>{});
            info.version     = optional_string_field(block, "version").value_or("1.0");
            if (const auto created = optional_string_field(block, "created_date")) {
                info.created_date = parse_iso8601(*created).value_or(Timestamp{});
            }
            if (const auto modified = optional_string_field(block, "modified_date")) {
                info.modified_date = parse_iso8601(*modified).value_or(Timestamp{});
            }
            if (info.id.empty() && info.name.empty()) {
                return std::nullopt;
            }
            return info;
        }

        // Accepts a single string or an array of lines; lines already ending in '\n' are concatenated.
        std::optional<std::string> join_source(const nlohmann::json& cell) {
            if (!cell.contains("source") || cell.at("source").is_null()) {
                return std::string{};
            }
            const auto& source = cell.at("source");
            if (source.is_string()) {
                return source.get<std::string>();
            }
            if (!source.is_array()) {
                return std::nullopt;
            }
            std::vector<std::string> lines;
            lines.reserve(source.size());
            for (const auto& line : source) {
                if (!line.is_string()) {
                    return std::nullopt;
                }
                lines.push_back(line.get<std::string>());
            }
            const bool newline_terminated =
                lines.size() > 1 && std::all_of(lines.begin(), lines.end() - 1, [](const std::string& line) { return line.ends_with('\n'); });
            if (!newline_terminated) {
                return join_lines(lines);
            }
            std::string joined;
            for (const auto& line : lines) {
                joined.append(line);
            }
            return joined;
        }

        // Non-fatal parse of the document shell shared by import and analysis.
        CodecResult<nlohmann::json> parse_root(std::string_view text) {
            auto root = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
            if (root.is_discarded()) {
                return std::unexpected(ImportError{.kind = ImportErrorKind::kInvalidJson, .message = "document is not valid JSON"});
            }
            if (!root.is_object() || !root.contains("cells") || !root.at("cells").is_array()) {
                return std::unexpected(ImportError{.kind = ImportErrorKind::kMissingCells, .message = "document has no cells array"});
            }
            return root;
        }

        const nlohmann::json& document_metadata(const nlohmann::json& root) {
            static const nlohmann::json kEmpty = nlohmann::json::object();
            if (!root.contains("metadata") || !root.at("metadata").is_object()) {
                return kEmpty;
            }
            return root.at("metadata");
        }

        template <typename T>
        void append_unique(std::vector<T>& values, const T& value) {
            if (std::ranges::find(values, value) == values.end()) {
                values.push_back(value);
            }
        }

    } // namespace

    nlohmann::json workspace_block_json(const WorkspaceDocumentInfo& info) {
        return {
            {"id", info.id},
            {"name", info.name},
            {"description", info.description},
            {"category", info.category},
            {"is_template", info.is_template},
            {"created_date", format_iso8601(info.created_date)},
            {"modified_date", format_iso8601(info.modified_date)},
            {"tags", info.tags},
            {"version", info.version},
        };
    }

    std::string format_import_error(const ImportError& error) {
        if (!error.cell_index) {
            return error.message;
        }
        return "cell " + std::to_string(*error.cell_index) + ": " + error.message;
    }

    NotebookCodec::NotebookCodec(CodecOptions options, PayloadExtractors extractors) : options_(std::move(options)), extractors_(std::move(extractors)) {
        if (!options_.clock) {
            options_.clock = [] { return Clock::now(); };
        }
    }

    nlohmann::json NotebookCodec::export_json(const std::vector<WindowRecord>& records, const std::optional<WorkspaceDocumentInfo>& workspace) const {
        std::vector<const WindowRecord*> ordered;
        ordered.reserve(records.size());
        for (const auto& record : records) {
            ordered.push_back(&record);
        }
        std::ranges::sort(ordered, {}, [](const WindowRecord* record) { return record->id; });

        std::set<std::string> types;
        std::set<std::string> templates;
        std::set<std::string> tags;
        nlohmann::json        cells = nlohmann::json::array();
        for (const auto* record : ordered) {
            types.emplace(window_type_name(record->type));
            templates.emplace(export_template_name(record->state.export_template));
            tags.insert(record->state.tags.begin(), record->state.tags.end());
            cells.push_back(cell_json(*record));
        }

        nlohmann::json metadata = {
            {"kernelspec", kernelspec()},
            {"language_info", language_info()},
        };
        metadata[std::string(kAggregateBlockKey)] = {
            {"export_date", format_iso8601(options_.clock())},
            {"total_windows", ordered.size()},
            {"window_types", types},
            {"export_templates", templates},
            {"all_tags", tags},
            {"created_by", options_.created_by},
            {"platform_version", "1.0"},
        };
        if (workspace) {
            metadata[std::string(kWorkspaceBlockKey)] = workspace_block_json(*workspace);
        }

        return {
            {"cells", std::move(cells)},
            {"metadata", std::move(metadata)},
            {"nbformat", kNbformat},
            {"nbformat_minor", kNbformatMinor},
        };
    }

    std::string NotebookCodec::export_records(const std::vector<WindowRecord>& records, const std::optional<WorkspaceDocumentInfo>& workspace) const {
        return export_json(records, workspace).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::string NotebookCodec::export_document(const WindowRegistry& registry, const std::optional<WorkspaceDocumentInfo>& workspace) const {
        return export_records(registry.list_all(false), workspace);
    }

    WindowRecord NotebookCodec::restore_cell(const nlohmann::json& cell, const nlohmann::json& metadata, WindowType type, int id) const {
        const auto   now = options_.clock();
        WindowRecord record;
        record.id   = id;
        record.type = type;

        if (metadata.contains("position") && metadata.at("position").is_object()) {
            const auto&          position = metadata.at("position");
            const WindowPosition defaults;
            record.position.x      = optional_double_field(position, "x").value_or(defaults.x);
            record.position.y      = optional_double_field(position, "y").value_or(defaults.y);
            record.position.z      = optional_double_field(position, "z").value_or(defaults.z);
            record.position.width  = optional_double_field(position, "width").value_or(defaults.width);
            record.position.height = optional_double_field(position, "height").value_or(defaults.height);
            record.position.depth  = optional_double_field(position, "depth");
        }

        if (metadata.contains("state") && metadata.at("state").is_object()) {
            const auto& state       = metadata.at("state");
            record.state.minimized  = optional_bool_field(state, "minimized").value_or(false);
            record.state.maximized  = optional_bool_field(state, "maximized").value_or(false);
            record.state.opacity    = std::clamp(optional_double_field(state, "opacity").value_or(1.0), 0.0, 1.0);
        }

        if (const auto value = optional_string_field(metadata, "export_template")) {
            record.state.export_template = parse_export_template(*value).value_or(ExportTemplate::kPlain);
        }
        if (const auto tags = optional_string_array_field(metadata, "tags")) {
            for (const auto& tag : *tags) {
                if (!tag.empty()) {
                    append_unique(record.state.tags, tag);
                }
            }
        }

        record.created_at          = now;
        record.state.last_modified = now;
        if (metadata.contains("timestamps") && metadata.at("timestamps").is_object()) {
            const auto& timestamps = metadata.at("timestamps");
            if (const auto created = optional_string_field(timestamps, "created")) {
                record.created_at = parse_iso8601(*created).value_or(now);
            }
            if (const auto modified = optional_string_field(timestamps, "modified")) {
                record.state.last_modified = parse_iso8601(*modified).value_or(now);
            }
        }

        const auto source = join_source(cell);
        if (!source) {
            throw std::invalid_argument("cell source is not text");
        }
        record.state.content = strip_fallback_header(*source);
        if (auto payload = extractors_.extract(type, *source)) {
            record.state.payload = std::move(*payload);
        }
        return record;
    }

    CodecResult<ImportResult> NotebookCodec::parse_document(std::string_view text, int first_id) const {
        const auto root = parse_root(text);
        if (!root) {
            error_log(kContext, root.error().message);
            return std::unexpected(root.error());
        }

        ImportResult result;
        const auto&  metadata   = document_metadata(*root);
        result.original_metadata = parse_summary(metadata);
        result.workspace         = parse_workspace(metadata);

        const auto& cells   = root->at("cells");
        int         next_id = std::max(first_id, 1);
        for (size_t index = 0; index < cells.size(); ++index) {
            const auto& cell = cells.at(index);
            if (!cell.is_object() || !cell.contains("metadata") || !cell.at("metadata").is_object()) {
                continue;
            }
            const auto& cell_metadata = cell.at("metadata");
            if (!cell_metadata.contains("window_type")) {
                continue;
            }
            const auto& type_value = cell_metadata.at("window_type");
            if (!type_value.is_string()) {
                result.errors.push_back(ImportError{.kind = ImportErrorKind::kMalformedMetadata, .message = "window_type is not a string", .cell_index = index});
                continue;
            }
            const auto type = parse_window_type(type_value.get<std::string>());
            if (!type) {
                debug_log(options_.debug_logging, kContext, "skipping cell " + std::to_string(index) + " with unknown window type");
                continue;
            }

            std::optional<WindowRecord> record;
            std::string                 failure;
            const bool                  restored = failsafe::guard([&] { record = restore_cell(cell, cell_metadata, *type, next_id); },
                                                                   [&](std::string_view, std::string_view message) { failure = std::string(message); }, kContext);
            if (!restored || !record) {
                result.errors.push_back(ImportError{.kind = ImportErrorKind::kCellFailed, .message = failure, .cell_index = index});
                continue;
            }
            if (const auto old_id = optional_int_field(cell_metadata, "window_id")) {
                result.id_mapping[*old_id] = next_id;
            }
            result.restored.push_back(std::move(*record));
            ++next_id;
        }

        for (const auto& error : result.errors) {
            error_log(kContext, format_import_error(error));
        }
        debug_log(options_.debug_logging, kContext,
                  "restored " + std::to_string(result.restored.size()) + " windows with " + std::to_string(result.errors.size()) + " errors");
        return result;
    }

    CodecResult<ImportResult> NotebookCodec::import_document(std::string_view text, WindowRegistry& registry) const {
        auto result = parse_document(text, registry.next_id());
        if (!result) {
            return result;
        }
        std::vector<WindowRecord> inserted;
        inserted.reserve(result->restored.size());
        for (auto& record : result->restored) {
            if (!registry.insert(record)) {
                result->errors.push_back(ImportError{.kind = ImportErrorKind::kCellFailed, .message = "window id " + std::to_string(record.id) + " already in use"});
                continue;
            }
            inserted.push_back(std::move(record));
        }
        result->restored = std::move(inserted);
        return result;
    }

    CodecResult<DocumentAnalysis> NotebookCodec::analyze(std::string_view text) const {
        const auto root = parse_root(text);
        if (!root) {
            return std::unexpected(root.error());
        }
        DocumentAnalysis analysis;
        const auto&      metadata = document_metadata(*root);
        analysis.summary          = parse_summary(metadata);
        analysis.workspace        = parse_workspace(metadata);

        const auto& cells         = root->at("cells");
        analysis.total_cells      = cells.size();
        for (const auto& cell : cells) {
            if (!cell.is_object() || !cell.contains("metadata")) {
                continue;
            }
            const auto& cell_metadata = cell.at("metadata");
            const auto  type_name     = optional_string_field(cell_metadata, "window_type");
            const auto  type          = type_name ? parse_window_type(*type_name) : std::nullopt;
            if (!type) {
                continue;
            }
            ++analysis.window_cells;
            append_unique(analysis.window_types, *type);
            if (const auto value = optional_string_field(cell_metadata, "export_template")) {
                append_unique(analysis.export_templates, *value);
            }
            for (const auto& tag : optional_string_array_field(cell_metadata, "tags").value_or(std::vector<std::string>{})) {
                append_unique(analysis.all_tags, tag);
            }
        }
        return analysis;
    }

    bool NotebookCodec::validate(std::string_view text, std::string* error) const {
        if (error) {
            error->clear();
        }
        const auto root = parse_root(text);
        if (!root) {
            if (error) {
                *error = root.error().message;
            }
            return false;
        }
        return true;
    }

} // namespace spatialbook
