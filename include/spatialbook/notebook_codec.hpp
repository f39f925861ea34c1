#ifndef SPATIALBOOK_NOTEBOOK_CODEC_HPP
#define SPATIALBOOK_NOTEBOOK_CODEC_HPP

#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "spatialbook/payload_extractors.hpp"
#include "spatialbook/time_utils.hpp"
#include "spatialbook/types.hpp"
#include "spatialbook/window_registry.hpp"

namespace spatialbook {

    inline constexpr std::string_view kAggregateBlockKey = "visionos_export";
    inline constexpr std::string_view kWorkspaceBlockKey = "workspace_metadata";
    inline constexpr int              kNbformat          = 4;
    inline constexpr int              kNbformatMinor     = 5;

    enum class ImportErrorKind {
        // Fatal: no records are produced.
        kInvalidJson,
        kMissingCells,
        // Per cell: the cell is skipped and import continues.
        kMalformedMetadata,
        kCellFailed,
    };

    struct ImportError {
        ImportErrorKind       kind;
        std::string           message;
        std::optional<size_t> cell_index = std::nullopt;
    };

    std::string format_import_error(const ImportError& error);

    template <typename T>
    using CodecResult = std::expected<T, ImportError>;

    // Aggregate block written at export time. Informational only on import.
    struct ExportSummary {
        std::optional<Timestamp> export_date;
        int                      total_windows = 0;
        std::vector<std::string> window_types;
        std::vector<std::string> export_templates;
        std::vector<std::string> all_tags;
        std::string              created_by;
        std::string              platform_version;
    };

    struct WorkspaceDocumentInfo {
        std::string              id;
        std::string              name;
        std::string              description;
        std::string              category;
        bool                     is_template = false;
        Timestamp                created_date;
        Timestamp                modified_date;
        std::vector<std::string> tags;
        std::string              version = "1.0";
    };

    nlohmann::json workspace_block_json(const WorkspaceDocumentInfo& info);

    struct ImportResult {
        std::vector<WindowRecord>            restored;
        std::vector<ImportError>             errors;
        std::map<int, int>                   id_mapping;
        std::optional<ExportSummary>         original_metadata;
        std::optional<WorkspaceDocumentInfo> workspace;
    };

    struct DocumentAnalysis {
        size_t                               total_cells  = 0;
        size_t                               window_cells = 0;
        std::vector<WindowType>              window_types;
        std::vector<std::string>             export_templates;
        std::vector<std::string>             all_tags;
        std::optional<ExportSummary>         summary;
        std::optional<WorkspaceDocumentInfo> workspace;

        bool                                 is_native() const {
            return summary.has_value();
        }
    };

    struct CodecOptions {
        ClockSource clock         = [] { return Clock::now(); };
        std::string created_by    = "spatialbook";
        bool        debug_logging = false;
    };

    class NotebookCodec {
      public:
        explicit NotebookCodec(CodecOptions options = {}, PayloadExtractors extractors = PayloadExtractors::with_default_matchers());

        nlohmann::json                export_json(const std::vector<WindowRecord>& records, const std::optional<WorkspaceDocumentInfo>& workspace = std::nullopt) const;
        std::string                   export_records(const std::vector<WindowRecord>& records, const std::optional<WorkspaceDocumentInfo>& workspace = std::nullopt) const;
        std::string                   export_document(const WindowRegistry& registry, const std::optional<WorkspaceDocumentInfo>& workspace = std::nullopt) const;

        // Restores window cells with ids allocated from first_id upward. Does not touch any registry.
        CodecResult<ImportResult>     parse_document(std::string_view text, int first_id) const;
        // parse_document with ids taken from the registry, then inserts every restored record.
        CodecResult<ImportResult>     import_document(std::string_view text, WindowRegistry& registry) const;

        CodecResult<DocumentAnalysis> analyze(std::string_view text) const;
        bool                          validate(std::string_view text, std::string* error) const;

      private:
        WindowRecord      restore_cell(const nlohmann::json& cell, const nlohmann::json& metadata, WindowType type, int id) const;

        CodecOptions      options_;
        PayloadExtractors extractors_;
    };

} // namespace spatialbook

#endif // SPATIALBOOK_NOTEBOOK_CODEC_HPP
