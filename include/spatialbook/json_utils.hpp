#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace spatialbook {

    std::optional<std::string>              optional_string(const nlohmann::json& value);
    std::optional<std::string>              optional_string_field(const nlohmann::json& obj, const char* key);
    std::optional<int>                      optional_int_field(const nlohmann::json& obj, const char* key);
    std::optional<double>                   optional_double_field(const nlohmann::json& obj, const char* key);
    std::optional<bool>                     optional_bool_field(const nlohmann::json& obj, const char* key);

    // Non-string elements are skipped; nullopt when the field is absent or not an array.
    std::optional<std::vector<std::string>> optional_string_array_field(const nlohmann::json& obj, const char* key);

}
