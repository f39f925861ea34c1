#ifndef SPATIALBOOK_WORKSPACE_METADATA_STORE_HPP
#define SPATIALBOOK_WORKSPACE_METADATA_STORE_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "spatialbook/notebook_codec.hpp"
#include "spatialbook/time_utils.hpp"
#include "spatialbook/window_registry.hpp"

namespace spatialbook {

    enum class WorkspaceCategory {
        kCustom,
        kTemplate,
        kDemo,
        kDataVisualization,
        kAnalysis,
        kModeling,
        kDashboard,
        kResearch,
    };

    std::string_view                      workspace_category_name(WorkspaceCategory category);
    std::optional<WorkspaceCategory>      parse_workspace_category(std::string_view value);
    const std::vector<WorkspaceCategory>& all_workspace_categories();

    struct WorkspaceRecord {
        std::string                          id;
        std::string                          name;
        std::string                          description;
        WorkspaceCategory                    category    = WorkspaceCategory::kCustom;
        bool                                 is_template = false;
        Timestamp                            created_date;
        Timestamp                            modified_date;
        int                                  total_windows = 0;
        std::vector<std::string>             window_types;
        std::vector<std::string>             tags;
        std::string                          version = "1.0";
        std::optional<std::filesystem::path> file_path;

        bool                                 operator==(const WorkspaceRecord&) const = default;
    };

    WorkspaceDocumentInfo to_document_info(const WorkspaceRecord& record);

    enum class WorkspaceErrorKind {
        kInvalidName,
        kDuplicateName,
        kNotFound,
        kFileNotFound,
        kDirectoryCreationFailed,
        kSaveFailed,
        kLoadFailed,
    };

    struct WorkspaceError {
        WorkspaceErrorKind kind;
        std::string        message;
    };

    std::string format_workspace_error(const WorkspaceError& error);

    template <typename T>
    using WorkspaceResult = std::expected<T, WorkspaceError>;

    struct CreateWorkspaceRequest {
        std::string              name;
        std::string              description;
        WorkspaceCategory        category = WorkspaceCategory::kCustom;
        std::vector<std::string> tags;
        bool                     is_template = false;
    };

    struct WorkspaceStoreOptions {
        std::filesystem::path     index_path;
        std::filesystem::path     workspaces_dir;
        std::chrono::milliseconds open_delay    = std::chrono::milliseconds(200);
        bool                      debug_logging = false;
        ClockSource               clock         = [] { return Clock::now(); };
    };

    // Asks the presentation layer to show a restored window.
    using OpenWindowCallback = std::function<void(int)>;

    // "<sanitized name>_<yyyyMMdd_HHmmss>.ipynb", or "..._<n>.ipynb" for attempt n > 1.
    std::string workspace_file_name(std::string_view name, Timestamp now, int attempt = 1);

    // Index of saved workspaces, one document file per workspace. Thread-safe.
    class WorkspaceMetadataStore {
      public:
        explicit WorkspaceMetadataStore(WorkspaceStoreOptions options, NotebookCodec codec = NotebookCodec{});

        // Reads the index and relinks or drops records whose file moved. Falls back to scanning the
        // documents directory when the index is absent or unreadable.
        void                                 load();
        WorkspaceResult<void>                save() const;

        WorkspaceResult<WorkspaceRecord>     create(const CreateWorkspaceRequest& request, const WindowRegistry& registry);
        WorkspaceResult<WorkspaceRecord>     save_workspace(std::string_view id, const WindowRegistry& registry);
        // Windows are opened in ascending id order, each marked opened before the next starts.
        WorkspaceResult<ImportResult>        load_workspace(std::string_view id, WindowRegistry& registry, const OpenWindowCallback& open_window,
                                                            bool clear_existing = true);
        // Re-derives window counts and kinds from the backing files. Returns the number of records changed.
        size_t                               refresh();
        WorkspaceResult<void>                delete_workspace(std::string_view id);
        WorkspaceResult<WorkspaceRecord>     duplicate_workspace(std::string_view id);

        std::vector<WorkspaceRecord>         all() const;
        std::vector<WorkspaceRecord>         custom() const;
        std::vector<WorkspaceRecord>         templates() const;
        std::vector<WorkspaceRecord>         by_category(WorkspaceCategory category) const;
        std::vector<WorkspaceRecord>         search(std::string_view query) const;
        std::optional<WorkspaceRecord>       find_by_id(std::string_view id) const;
        std::optional<WorkspaceRecord>       find_by_name(std::string_view name) const;
        size_t                               size() const;

        const WorkspaceStoreOptions&         options() const;

      private:
        std::optional<std::vector<WorkspaceRecord>> read_index() const;
        std::vector<WorkspaceRecord>                scan_directory() const;
        std::optional<WorkspaceRecord>              record_from_document(const std::filesystem::path& path) const;
        // A document path in the workspaces directory that neither exists nor is referenced by a record.
        std::filesystem::path                       unused_document_path(std::string_view name, Timestamp now) const;
        WorkspaceResult<std::filesystem::path>      write_document(const WorkspaceRecord& record, const WindowRegistry& registry, std::optional<std::filesystem::path> target) const;
        WorkspaceResult<void>                       save_locked() const;
        void                                        persist_locked() const;

        WorkspaceStoreOptions                       options_;
        NotebookCodec                               codec_;
        mutable std::mutex                          mutex_;
        std::vector<WorkspaceRecord>                records_;
    };

} // namespace spatialbook

#endif // SPATIALBOOK_WORKSPACE_METADATA_STORE_HPP
