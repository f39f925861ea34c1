#ifndef SPATIALBOOK_COMMAND_HPP
#define SPATIALBOOK_COMMAND_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "spatialbook/workspace_metadata_store.hpp"

namespace spatialbook {

    enum class CommandKind {
        kList,
        kSearch,
        kShow,
        kRefresh,
        kCreate,
        kDelete,
        kDuplicate,
        kInspect,
    };

    enum class ListFilter {
        kAll,
        kTemplates,
        kCustom,
    };

    struct Command {
        CommandKind                      kind;
        ListFilter                       list_filter   = ListFilter::kAll;
        std::optional<std::string>       query         = std::nullopt;
        std::optional<std::string>       name          = std::nullopt;
        std::optional<std::string>       document_path = std::nullopt;
        std::string                      description   = {};
        std::optional<WorkspaceCategory> category      = std::nullopt;
        bool                             is_template   = false;
    };

    struct ParseError {
        std::string message;
    };

    std::variant<Command, ParseError> parse_command(std::string_view args);
    std::variant<Command, ParseError> parse_command_tokens(const std::vector<std::string>& tokens);

} // namespace spatialbook

#endif // SPATIALBOOK_COMMAND_HPP
