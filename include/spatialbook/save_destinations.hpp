#ifndef SPATIALBOOK_SAVE_DESTINATIONS_HPP
#define SPATIALBOOK_SAVE_DESTINATIONS_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "spatialbook/config.hpp"

namespace spatialbook {

    // Success carries the written location, if the destination has one.
    using DestinationResult = std::expected<std::optional<std::filesystem::path>, std::string>;

    class SaveDestination {
      public:
        virtual ~SaveDestination()                                                                    = default;
        virtual SaveDestinationKind kind() const                                                      = 0;
        virtual DestinationResult   write(std::string_view workspace_name, const std::string& document) = 0;
    };

    // Writes <directory>/<sanitized workspace>.ipynb, replacing the previous autosave atomically.
    class LocalFileDestination : public SaveDestination {
      public:
        explicit LocalFileDestination(std::filesystem::path directory);

        SaveDestinationKind   kind() const override;
        DestinationResult     write(std::string_view workspace_name, const std::string& document) override;
        std::filesystem::path path_for(std::string_view workspace_name) const;

      private:
        std::filesystem::path directory_;
    };

    // Transport to a notebook server. Implementations must give up after timeout and report it as an error.
    class RemoteNotebookClient {
      public:
        virtual ~RemoteNotebookClient() = default;
        virtual std::expected<void, std::string> put_notebook(std::string_view server_url, std::string_view name, const std::string& document,
                                                              std::chrono::milliseconds timeout) = 0;
    };

    class RemoteServerDestination : public SaveDestination {
      public:
        RemoteServerDestination(RemoteNotebookClient& client, std::string server_url, std::chrono::milliseconds timeout);

        SaveDestinationKind kind() const override;
        DestinationResult   write(std::string_view workspace_name, const std::string& document) override;

      private:
        RemoteNotebookClient&     client_;
        std::string               server_url_;
        std::chrono::milliseconds timeout_;
    };

    std::string notebook_file_name(std::string_view workspace_name);

} // namespace spatialbook

#endif // SPATIALBOOK_SAVE_DESTINATIONS_HPP
