#include "spatialbook/command.hpp"

#include <cctype>

namespace spatialbook {

    namespace {

        std::optional<std::string> split_tokens(std::string_view args, std::vector<std::string>* tokens) {
            std::string current;
            bool        in_quotes = false;
            bool        escaped   = false;
            bool        quoted    = false;
            char        quote     = '\0';
            for (const char ch : args) {
                if (escaped) {
                    current.push_back(ch);
                    escaped = false;
                    continue;
                }
                if (in_quotes && ch == '\\') {
                    escaped = true;
                    continue;
                }
                if (in_quotes) {
                    if (ch == quote) {
                        in_quotes = false;
                        continue;
                    }
                    current.push_back(ch);
                    continue;
                }
                if (ch == '"' || ch == '\'') {
                    in_quotes = true;
                    quoted    = true;
                    quote     = ch;
                    continue;
                }
                if (std::isspace(static_cast<unsigned char>(ch))) {
                    if (!current.empty() || quoted) {
                        tokens->push_back(current);
                        current.clear();
                        quoted = false;
                    }
                    continue;
                }
                current.push_back(ch);
            }
            if (escaped || in_quotes) {
                return std::string("unterminated quote");
            }
            if (!current.empty() || quoted) {
                tokens->push_back(std::move(current));
            }
            return std::nullopt;
        }

        std::variant<Command, ParseError> single_name(CommandKind kind, const std::vector<std::string>& tokens, const char* missing) {
            if (tokens.size() < 2 || tokens[1].empty()) {
                return ParseError{missing};
            }
            if (tokens.size() > 2) {
                return ParseError{"unexpected extra arguments"};
            }
            return Command{.kind = kind, .name = tokens[1]};
        }

        std::variant<Command, ParseError> parse_create(const std::vector<std::string>& tokens) {
            if (tokens.size() < 2 || tokens[1].empty() || tokens[1].starts_with("--")) {
                return ParseError{"missing workspace name"};
            }
            Command command{.kind = CommandKind::kCreate, .name = tokens[1]};
            for (size_t i = 2; i < tokens.size(); ++i) {
                const auto& option = tokens[i];
                if (option == "--template") {
                    command.is_template = true;
                    continue;
                }
                if (option != "--from" && option != "--description" && option != "--category") {
                    return ParseError{"unknown create option: " + option};
                }
                if (i + 1 >= tokens.size()) {
                    return ParseError{"missing value for " + option};
                }
                const auto& value = tokens[++i];
                if (option == "--from") {
                    command.document_path = value;
                } else if (option == "--description") {
                    command.description = value;
                } else {
                    command.category = parse_workspace_category(value);
                    if (!command.category) {
                        return ParseError{"unknown category: " + value};
                    }
                }
            }
            return command;
        }

    } // namespace

    std::variant<Command, ParseError> parse_command(std::string_view args) {
        std::vector<std::string> tokens;
        if (const auto error = split_tokens(args, &tokens)) {
            return ParseError{*error};
        }
        return parse_command_tokens(tokens);
    }

    std::variant<Command, ParseError> parse_command_tokens(const std::vector<std::string>& tokens) {
        if (tokens.empty()) {
            return ParseError{"missing command"};
        }

        if (tokens[0] == "list") {
            if (tokens.size() > 2) {
                return ParseError{"unexpected extra arguments"};
            }
            if (tokens.size() == 1) {
                return Command{.kind = CommandKind::kList};
            }
            if (tokens[1] == "templates") {
                return Command{.kind = CommandKind::kList, .list_filter = ListFilter::kTemplates};
            }
            if (tokens[1] == "custom") {
                return Command{.kind = CommandKind::kList, .list_filter = ListFilter::kCustom};
            }
            return ParseError{"unknown list filter"};
        }

        if (tokens[0] == "search") {
            if (tokens.size() < 2) {
                return ParseError{"missing search query"};
            }
            if (tokens.size() > 2) {
                return ParseError{"unexpected extra arguments"};
            }
            return Command{.kind = CommandKind::kSearch, .query = tokens[1]};
        }

        if (tokens[0] == "refresh") {
            if (tokens.size() > 1) {
                return ParseError{"unexpected extra arguments"};
            }
            return Command{.kind = CommandKind::kRefresh};
        }

        if (tokens[0] == "show") {
            return single_name(CommandKind::kShow, tokens, "missing workspace name");
        }
        if (tokens[0] == "delete") {
            return single_name(CommandKind::kDelete, tokens, "missing workspace name");
        }
        if (tokens[0] == "duplicate") {
            return single_name(CommandKind::kDuplicate, tokens, "missing workspace name");
        }
        if (tokens[0] == "create") {
            return parse_create(tokens);
        }

        if (tokens[0] == "inspect") {
            if (tokens.size() < 2) {
                return ParseError{"missing document path"};
            }
            if (tokens.size() > 2) {
                return ParseError{"unexpected extra arguments"};
            }
            return Command{.kind = CommandKind::kInspect, .document_path = tokens[1]};
        }

        return ParseError{"unknown command"};
    }

} // namespace spatialbook
