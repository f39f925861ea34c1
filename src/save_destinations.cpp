#include "spatialbook/save_destinations.hpp"

#include <utility>

#include "spatialbook/failsafe.hpp"
#include "spatialbook/file_io.hpp"
#include "spatialbook/strings.hpp"

namespace spatialbook {

    std::string notebook_file_name(std::string_view workspace_name) {
        return sanitize_file_stem(workspace_name) + ".ipynb";
    }

    LocalFileDestination::LocalFileDestination(std::filesystem::path directory) : directory_(std::move(directory)) {}

    SaveDestinationKind LocalFileDestination::kind() const {
        return SaveDestinationKind::kLocal;
    }

    std::filesystem::path LocalFileDestination::path_for(std::string_view workspace_name) const {
        return directory_ / notebook_file_name(workspace_name);
    }

    DestinationResult LocalFileDestination::write(std::string_view workspace_name, const std::string& document) {
        const auto path = path_for(workspace_name);
        if (const auto error = write_text_file_atomic(path, document)) {
            return std::unexpected(*error);
        }
        return std::optional<std::filesystem::path>(path);
    }

    RemoteServerDestination::RemoteServerDestination(RemoteNotebookClient& client, std::string server_url, std::chrono::milliseconds timeout) :
        client_(client), server_url_(std::move(server_url)), timeout_(timeout) {}

    SaveDestinationKind RemoteServerDestination::kind() const {
        return SaveDestinationKind::kRemote;
    }

    DestinationResult RemoteServerDestination::write(std::string_view workspace_name, const std::string& document) {
        std::expected<void, std::string> sent = std::unexpected(std::string("remote client did not respond"));
        const auto failure = failsafe::capture([&] { sent = client_.put_notebook(server_url_, notebook_file_name(workspace_name), document, timeout_); });
        if (failure) {
            return std::unexpected("remote save failed: " + *failure);
        }
        if (!sent) {
            return std::unexpected("remote save failed: " + sent.error());
        }
        return std::optional<std::filesystem::path>{};
    }

} // namespace spatialbook
