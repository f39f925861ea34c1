#include "spatialbook/workspace_metadata_store.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <system_error>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

#include "spatialbook/failsafe.hpp"
#include "spatialbook/file_io.hpp"
#include "spatialbook/json_utils.hpp"
#include "spatialbook/logging.hpp"
#include "spatialbook/strings.hpp"
#include "spatialbook/uuid.hpp"

namespace spatialbook {

    namespace {

        constexpr std::string_view kContext = "workspace store";

        WorkspaceError             make_error(WorkspaceErrorKind kind, std::string message) {
            return WorkspaceError{.kind = kind, .message = std::move(message)};
        }

        nlohmann::json record_json(const WorkspaceRecord& record) {
            nlohmann::json json = {
                {"id", record.id},
                {"name", record.name},
                {"description", record.description},
                {"category", std::string(workspace_category_name(record.category))},
                {"is_template", record.is_template},
                {"created_date", format_iso8601(record.created_date)},
                {"modified_date", format_iso8601(record.modified_date)},
                {"total_windows", record.total_windows},
                {"window_types", record.window_types},
                {"tags", record.tags},
                {"version", record.version},
            };
            if (record.file_path) {
                json["file_path"] = record.file_path->string();
            }
            return json;
        }

        std::optional<WorkspaceRecord> record_from_json(const nlohmann::json& json) {
            const auto id   = optional_string_field(json, "id");
            const auto name = optional_string_field(json, "name");
            if (!id || !name) {
                return std::nullopt;
            }
            WorkspaceRecord record;
            record.id            = *id;
            record.name          = *name;
            record.description   = optional_string_field(json, "description").value_or("");
            record.category      = parse_workspace_category(optional_string_field(json, "category").value_or("")).value_or(WorkspaceCategory::kCustom);
            record.is_template   = optional_bool_field(json, "is_template").value_or(false);
            record.total_windows = optional_int_field(json, "total_windows").value_or(0);
            record.window_types  = optional_string_array_field(json, "window_types").value_or(std::vector<std::string>{});
            record.tags          = optional_string_array_field(json, "tags").value_or(std::vector<std::string>{});
            record.version       = optional_string_field(json, "version").value_or("1.0");
            if (const auto created = optional_string_field(json, "created_date")) {
                record.created_date = parse_iso8601(*created).value_or(Timestamp{});
            }
            if (const auto modified = optional_string_field(json, "modified_date")) {
                record.modified_date = parse_iso8601(*modified).value_or(record.created_date);
            }
            if (const auto path = optional_string_field(json, "file_path")) {
                record.file_path = std::filesystem::path(*path);
            }
            return record;
        }

        std::vector<std::string> window_type_names(const std::vector<WindowType>& types) {
            std::set<std::string> names;
            for (const auto type : types) {
                names.emplace(window_type_name(type));
            }
            return {names.begin(), names.end()};
        }

        std::vector<std::string> registry_type_names(const WindowRegistry& registry) {
            std::vector<WindowType> types;
            for (const auto& record : registry.list_all(false)) {
                types.push_back(record.type);
            }
            return window_type_names(types);
        }

        bool file_exists(const std::optional<std::filesystem::path>& path) {
            std::error_code ec;
            return path && std::filesystem::is_regular_file(*path, ec) && !ec;
        }

        void sort_by_modified_desc(std::vector<WorkspaceRecord>& records) {
            std::ranges::stable_sort(records, [](const WorkspaceRecord& lhs, const WorkspaceRecord& rhs) { return lhs.modified_date > rhs.modified_date; });
        }

        auto find_record(std::vector<WorkspaceRecord>& records, std::string_view id) {
            return std::ranges::find_if(records, [&](const WorkspaceRecord& record) { return record.id == id; });
        }

    } // namespace

    std::string_view workspace_category_name(WorkspaceCategory category) {
        switch (category) {
            case WorkspaceCategory::kCustom: return "Custom";
            case WorkspaceCategory::kTemplate: return "Template";
            case WorkspaceCategory::kDemo: return "Demo";
            case WorkspaceCategory::kDataVisualization: return "Data Visualization";
            case WorkspaceCategory::kAnalysis: return "Analysis";
            case WorkspaceCategory::kModeling: return "3D Modeling";
            case WorkspaceCategory::kDashboard: return "Dashboard";
            case WorkspaceCategory::kResearch: return "Research";
        }
        return "Custom";
    }

    std::optional<WorkspaceCategory> parse_workspace_category(std::string_view value) {
        for (const auto category : all_workspace_categories()) {
            if (workspace_category_name(category) == value) {
                return category;
            }
        }
        return std::nullopt;
    }

    const std::vector<WorkspaceCategory>& all_workspace_categories() {
        static const std::vector<WorkspaceCategory> kCategories = {
            WorkspaceCategory::kCustom,   WorkspaceCategory::kTemplate,  WorkspaceCategory::kDemo,     WorkspaceCategory::kDataVisualization,
            WorkspaceCategory::kAnalysis, WorkspaceCategory::kModeling, WorkspaceCategory::kDashboard, WorkspaceCategory::kResearch,
        };
        return kCategories;
    }

    WorkspaceDocumentInfo to_document_info(const WorkspaceRecord& record) {
        return WorkspaceDocumentInfo{
            .id            = record.id,
            .name          = record.name,
            .description   = record.description,
            .category      = std::string(workspace_category_name(record.category)),
            .is_template   = record.is_template,
            .created_date  = record.created_date,
            .modified_date = record.modified_date,
            .tags          = record.tags,
            .version       = record.version,
        };
    }

    std::string format_workspace_error(const WorkspaceError& error) {
        std::string text;
        switch (error.kind) {
            case WorkspaceErrorKind::kInvalidName: text = "invalid workspace name"; break;
            case WorkspaceErrorKind::kDuplicateName: text = "a workspace with this name already exists"; break;
            case WorkspaceErrorKind::kNotFound: text = "workspace not found"; break;
            case WorkspaceErrorKind::kFileNotFound: text = "workspace file not found"; break;
            case WorkspaceErrorKind::kDirectoryCreationFailed: text = "failed to create workspace directory"; break;
            case WorkspaceErrorKind::kSaveFailed: text = "save error"; break;
            case WorkspaceErrorKind::kLoadFailed: text = "load error"; break;
        }
        if (!error.message.empty()) {
            text.append(": ");
            text.append(error.message);
        }
        return text;
    }

    std::string workspace_file_name(std::string_view name, Timestamp now, int attempt) {
        auto stem = sanitize_file_stem(name) + "_" + format_compact_stamp(now);
        if (attempt > 1) {
            stem += "_" + std::to_string(attempt);
        }
        return stem + ".ipynb";
    }

    WorkspaceMetadataStore::WorkspaceMetadataStore(WorkspaceStoreOptions options, NotebookCodec codec) : options_(std::move(options)), codec_(std::move(codec)) {
        if (!options_.clock) {
            options_.clock = [] { return Clock::now(); };
        }
    }

    const WorkspaceStoreOptions& WorkspaceMetadataStore::options() const {
        return options_;
    }

    std::optional<std::vector<WorkspaceRecord>> WorkspaceMetadataStore::read_index() const {
        std::error_code ec;
        if (!std::filesystem::exists(options_.index_path, ec)) {
            return std::nullopt;
        }
        const auto text = read_text_file(options_.index_path);
        if (!text) {
            error_log(kContext, "unable to read " + options_.index_path.string());
            return std::nullopt;
        }
        const auto root = nlohmann::json::parse(*text, nullptr, false);
        if (root.is_discarded() || !root.is_array()) {
            error_log(kContext, "workspace index is not a JSON array, rescanning");
            return std::nullopt;
        }
        std::vector<WorkspaceRecord> records;
        for (const auto& entry : root) {
            if (auto record = record_from_json(entry)) {
                records.push_back(std::move(*record));
            } else {
                debug_log(options_.debug_logging, kContext, "skipping index entry without id or name");
            }
        }
        return records;
    }

    std::optional<WorkspaceRecord> WorkspaceMetadataStore::record_from_document(const std::filesystem::path& path) const {
        const auto text = read_text_file(path);
        if (!text) {
            return std::nullopt;
        }
        const auto analysis = codec_.analyze(*text);
        if (!analysis) {
            debug_log(options_.debug_logging, kContext, path.filename().string() + ": " + format_import_error(analysis.error()));
            return std::nullopt;
        }

        std::error_code ec;
        const auto      write_time = std::filesystem::last_write_time(path, ec);
        const auto      stamp      = ec ? options_.clock() : to_system_time(write_time);

        WorkspaceRecord record;
        record.file_path     = path;
        record.created_date  = stamp;
        record.modified_date = stamp;
        record.total_windows = static_cast<int>(analysis->window_cells);
        record.window_types  = window_type_names(analysis->window_types);
        if (analysis->workspace) {
            const auto& info   = *analysis->workspace;
            record.id          = is_valid_uuid(info.id) ? info.id : generate_uuid();
            record.name        = info.name.empty() ? path.stem().string() : info.name;
            record.description = info.description;
            record.category    = parse_workspace_category(info.category).value_or(WorkspaceCategory::kCustom);
            record.is_template = info.is_template;
            record.tags        = info.tags;
            record.version     = info.version;
        } else {
            record.id          = generate_uuid();
            record.name        = path.stem().string();
            record.description = "Imported workspace";
        }
        return record;
    }

    std::vector<WorkspaceRecord> WorkspaceMetadataStore::scan_directory() const {
        std::vector<std::filesystem::path> files;
        std::error_code                    ec;
        for (std::filesystem::directory_iterator it(options_.workspaces_dir, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& path = it->path();
            if (path.extension() == ".ipynb" && !path.filename().string().starts_with(".") && it->is_regular_file(ec)) {
                files.push_back(path);
            }
        }
        std::ranges::sort(files);

        std::vector<WorkspaceRecord> records;
        for (const auto& path : files) {
            if (auto record = record_from_document(path)) {
                records.push_back(std::move(*record));
            }
        }
        return records;
    }

    void WorkspaceMetadataStore::load() {
        auto                         indexed = read_index();
        std::vector<WorkspaceRecord> records;
        if (!indexed) {
            records = scan_directory();
            debug_log(options_.debug_logging, kContext, "scanned " + std::to_string(records.size()) + " workspace documents");
        } else {
            for (auto& record : *indexed) {
                if (!record.file_path || file_exists(record.file_path)) {
                    records.push_back(std::move(record));
                    continue;
                }
                const auto relinked = options_.workspaces_dir / record.file_path->filename();
                if (file_exists(relinked)) {
                    debug_log(options_.debug_logging, kContext, "relinked " + record.name + " to " + relinked.string());
                    record.file_path = relinked;
                    records.push_back(std::move(record));
                    continue;
                }
                error_log(kContext, "dropping " + record.name + ": " + record.file_path->string() + " no longer exists");
            }
        }

        std::lock_guard lock(mutex_);
        records_ = std::move(records);
        persist_locked();
    }

    WorkspaceResult<void> WorkspaceMetadataStore::save() const {
        std::lock_guard lock(mutex_);
        return save_locked();
    }

    WorkspaceResult<void> WorkspaceMetadataStore::save_locked() const {
        nlohmann::json root = nlohmann::json::array();
        for (const auto& record : records_) {
            root.push_back(record_json(record));
        }
        if (const auto error = write_text_file_atomic(options_.index_path, root.dump(2))) {
            return std::unexpected(make_error(WorkspaceErrorKind::kSaveFailed, *error));
        }
        return {};
    }

    void WorkspaceMetadataStore::persist_locked() const {
        if (const auto saved = save_locked(); !saved) {
            error_log(kContext, format_workspace_error(saved.error()));
        }
    }

    std::filesystem::path WorkspaceMetadataStore::unused_document_path(std::string_view name, Timestamp now) const {
        for (int attempt = 1;; ++attempt) {
            auto            path = options_.workspaces_dir / workspace_file_name(name, now, attempt);
            std::error_code ec;
            const bool      on_disk = std::filesystem::exists(path, ec);
            const bool      claimed = std::ranges::any_of(records_, [&](const WorkspaceRecord& record) { return record.file_path == path; });
            if (!on_disk && !claimed) {
                return path;
            }
        }
    }

    WorkspaceResult<std::filesystem::path> WorkspaceMetadataStore::write_document(const WorkspaceRecord& record, const WindowRegistry& registry,
                                                                                  std::optional<std::filesystem::path> target) const {
        std::error_code ec;
        std::filesystem::create_directories(options_.workspaces_dir, ec);
        if (ec) {
            return std::unexpected(make_error(WorkspaceErrorKind::kDirectoryCreationFailed, ec.message()));
        }
        const auto path     = target ? *target : unused_document_path(record.name, record.modified_date);
        const auto document = codec_.export_document(registry, to_document_info(record));
        if (const auto error = write_text_file_atomic(path, document)) {
            return std::unexpected(make_error(WorkspaceErrorKind::kSaveFailed, *error));
        }
        return path;
    }

    WorkspaceResult<WorkspaceRecord> WorkspaceMetadataStore::create(const CreateWorkspaceRequest& request, const WindowRegistry& registry) {
        const auto name = trim_copy(request.name);
        if (name.empty()) {
            return std::unexpected(make_error(WorkspaceErrorKind::kInvalidName, {}));
        }

        std::lock_guard lock(mutex_);
        if (std::ranges::any_of(records_, [&](const WorkspaceRecord& record) { return record.name == name; })) {
            return std::unexpected(make_error(WorkspaceErrorKind::kDuplicateName, name));
        }

        const auto      now = options_.clock();
        WorkspaceRecord record;
        record.id            = generate_uuid();
        record.name          = name;
        record.description   = request.description;
        record.category      = request.category;
        record.is_template   = request.is_template;
        record.created_date  = now;
        record.modified_date = now;
        record.total_windows = static_cast<int>(registry.size());
        record.window_types  = registry_type_names(registry);
        record.tags          = request.tags;

        const auto path = write_document(record, registry, std::nullopt);
        if (!path) {
            error_log(kContext, format_workspace_error(path.error()));
            return std::unexpected(path.error());
        }
        record.file_path = *path;
        records_.push_back(record);
        persist_locked();
        debug_log(options_.debug_logging, kContext, "created " + record.name + " at " + path->string());
        return record;
    }

    WorkspaceResult<WorkspaceRecord> WorkspaceMetadataStore::save_workspace(std::string_view id, const WindowRegistry& registry) {
        std::lock_guard lock(mutex_);
        const auto      it = find_record(records_, id);
        if (it == records_.end()) {
            return std::unexpected(make_error(WorkspaceErrorKind::kNotFound, std::string(id)));
        }

        WorkspaceRecord updated = *it;
        updated.modified_date   = options_.clock();
        updated.total_windows   = static_cast<int>(registry.size());
        updated.window_types    = registry_type_names(registry);

        const auto path = write_document(updated, registry, updated.file_path);
        if (!path) {
            error_log(kContext, format_workspace_error(path.error()));
            return std::unexpected(path.error());
        }
        updated.file_path = *path;
        *it               = updated;
        persist_locked();
        return updated;
    }

    WorkspaceResult<ImportResult> WorkspaceMetadataStore::load_workspace(std::string_view id, WindowRegistry& registry, const OpenWindowCallback& open_window,
                                                                         bool clear_existing) {
        const auto record = find_by_id(id);
        if (!record) {
            return std::unexpected(make_error(WorkspaceErrorKind::kNotFound, std::string(id)));
        }
        if (!file_exists(record->file_path)) {
            return std::unexpected(make_error(WorkspaceErrorKind::kFileNotFound, record->file_path ? record->file_path->string() : record->name));
        }
        const auto text = read_text_file(*record->file_path);
        if (!text) {
            return std::unexpected(make_error(WorkspaceErrorKind::kLoadFailed, "unable to read " + record->file_path->string()));
        }
        std::string invalid;
        if (!codec_.validate(*text, &invalid)) {
            return std::unexpected(make_error(WorkspaceErrorKind::kLoadFailed, invalid));
        }

        if (clear_existing) {
            registry.clear_all();
        }
        auto imported = codec_.import_document(*text, registry);
        if (!imported) {
            return std::unexpected(make_error(WorkspaceErrorKind::kLoadFailed, format_import_error(imported.error())));
        }

        std::vector<int> ids;
        for (const auto& window : imported->restored) {
            ids.push_back(window.id);
        }
        std::ranges::sort(ids);
        for (size_t index = 0; index < ids.size(); ++index) {
            if (index > 0 && options_.open_delay > std::chrono::milliseconds::zero()) {
                std::this_thread::sleep_for(options_.open_delay);
            }
            const int window_id = ids[index];
            if (open_window) {
                const bool opened = failsafe::guard([&] { open_window(window_id); },
                                                    [](std::string_view context, std::string_view message) { error_log(context, message); }, kContext);
                if (!opened) {
                    continue;
                }
            }
            registry.mark_opened(window_id);
        }
        debug_log(options_.debug_logging, kContext, "loaded " + record->name + " with " + std::to_string(ids.size()) + " windows");
        return std::move(*imported);
    }

    size_t WorkspaceMetadataStore::refresh() {
        std::lock_guard lock(mutex_);
        size_t          changed = 0;
        for (auto& record : records_) {
            if (!file_exists(record.file_path)) {
                continue;
            }
            const auto text = read_text_file(*record.file_path);
            if (!text) {
                continue;
            }
            const auto analysis = codec_.analyze(*text);
            if (!analysis) {
                debug_log(options_.debug_logging, kContext, record.name + ": " + format_import_error(analysis.error()));
                continue;
            }
            const int  total = static_cast<int>(analysis->window_cells);
            const auto types = window_type_names(analysis->window_types);
            if (record.total_windows == total && record.window_types == types) {
                continue;
            }
            record.total_windows = total;
            record.window_types  = types;
            ++changed;
        }
        if (changed > 0) {
            persist_locked();
        }
        return changed;
    }

    WorkspaceResult<void> WorkspaceMetadataStore::delete_workspace(std::string_view id) {
        std::lock_guard lock(mutex_);
        const auto      it = find_record(records_, id);
        if (it == records_.end()) {
            return std::unexpected(make_error(WorkspaceErrorKind::kNotFound, std::string(id)));
        }
        if (it->file_path) {
            std::error_code ec;
            std::filesystem::remove(*it->file_path, ec);
            if (ec) {
                error_log(kContext, "unable to remove " + it->file_path->string() + ": " + ec.message());
            }
        }
        records_.erase(it);
        persist_locked();
        return {};
    }

    WorkspaceResult<WorkspaceRecord> WorkspaceMetadataStore::duplicate_workspace(std::string_view id) {
        std::lock_guard lock(mutex_);
        const auto      it = find_record(records_, id);
        if (it == records_.end()) {
            return std::unexpected(make_error(WorkspaceErrorKind::kNotFound, std::string(id)));
        }

        const auto      now  = options_.clock();
        WorkspaceRecord copy = *it;
        copy.id              = generate_uuid();
        copy.name            = it->name + " Copy";
        copy.created_date    = now;
        copy.modified_date   = now;
        copy.is_template     = false;
        copy.category        = WorkspaceCategory::kCustom;
        copy.file_path.reset();
        if (std::ranges::any_of(records_, [&](const WorkspaceRecord& record) { return record.name == copy.name; })) {
            return std::unexpected(make_error(WorkspaceErrorKind::kDuplicateName, copy.name));
        }

        if (file_exists(it->file_path)) {
            const auto text = read_text_file(*it->file_path);
            auto       root = text ? nlohmann::json::parse(*text, nullptr, false) : nlohmann::json(nlohmann::json::value_t::discarded);
            if (root.is_discarded() || !root.is_object()) {
                return std::unexpected(make_error(WorkspaceErrorKind::kLoadFailed, "unable to read " + it->file_path->string()));
            }
            if (!root.contains("metadata") || !root.at("metadata").is_object()) {
                root["metadata"] = nlohmann::json::object();
            }
            root["metadata"][std::string(kWorkspaceBlockKey)] = workspace_block_json(to_document_info(copy));

            std::error_code ec;
            std::filesystem::create_directories(options_.workspaces_dir, ec);
            if (ec) {
                return std::unexpected(make_error(WorkspaceErrorKind::kDirectoryCreationFailed, ec.message()));
            }
            const auto path = unused_document_path(copy.name, now);
            if (const auto error = write_text_file_atomic(path, root.dump(2, ' ', false, nlohmann::json::error_handler_t::replace))) {
                return std::unexpected(make_error(WorkspaceErrorKind::kSaveFailed, *error));
            }
            copy.file_path = path;
        }

        records_.push_back(copy);
        persist_locked();
        return copy;
    }

    std::vector<WorkspaceRecord> WorkspaceMetadataStore::all() const {
        std::lock_guard lock(mutex_);
        auto            records = records_;
        sort_by_modified_desc(records);
        return records;
    }

    std::vector<WorkspaceRecord> WorkspaceMetadataStore::custom() const {
        auto records = all();
        std::erase_if(records, [](const WorkspaceRecord& record) { return record.is_template; });
        return records;
    }

    std::vector<WorkspaceRecord> WorkspaceMetadataStore::templates() const {
        std::vector<WorkspaceRecord> records;
        {
            std::lock_guard lock(mutex_);
            std::ranges::copy_if(records_, std::back_inserter(records), [](const WorkspaceRecord& record) { return record.is_template; });
        }
        std::ranges::stable_sort(records, {}, &WorkspaceRecord::name);
        return records;
    }

    std::vector<WorkspaceRecord> WorkspaceMetadataStore::by_category(WorkspaceCategory category) const {
        auto records = all();
        std::erase_if(records, [&](const WorkspaceRecord& record) { return record.category != category; });
        return records;
    }

    std::vector<WorkspaceRecord> WorkspaceMetadataStore::search(std::string_view query) const {
        auto records = all();
        if (trim_view(query).empty()) {
            return records;
        }
        std::erase_if(records, [&](const WorkspaceRecord& record) {
            return !contains_case_insensitive(record.name, query) && !contains_case_insensitive(record.description, query) &&
                std::ranges::none_of(record.tags, [&](const std::string& tag) { return contains_case_insensitive(tag, query); });
        });
        return records;
    }

    std::optional<WorkspaceRecord> WorkspaceMetadataStore::find_by_id(std::string_view id) const {
        std::lock_guard lock(mutex_);
        const auto      it = std::ranges::find_if(records_, [&](const WorkspaceRecord& record) { return record.id == id; });
        if (it == records_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<WorkspaceRecord> WorkspaceMetadataStore::find_by_name(std::string_view name) const {
        std::lock_guard lock(mutex_);
        const auto      it = std::ranges::find_if(records_, [&](const WorkspaceRecord& record) { return record.name == name; });
        if (it == records_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    size_t WorkspaceMetadataStore::size() const {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

} // namespace spatialbook
