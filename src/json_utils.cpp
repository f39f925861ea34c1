#include "spatialbook/json_utils.hpp"

namespace spatialbook {

    std::optional<std::string> optional_string(const nlohmann::json& value) {
        if (!value.is_string()) {
            return std::nullopt;
        }
        auto str = value.get<std::string>();
        if (str.empty()) {
            return std::nullopt;
        }
        return str;
    }

    std::optional<std::string> optional_string_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key)) {
            return std::nullopt;
        }
        return optional_string(obj.at(key));
    }

    std::optional<int> optional_int_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_number_integer()) {
            return std::nullopt;
        }
        return obj.at(key).get<int>();
    }

    std::optional<double> optional_double_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_number()) {
            return std::nullopt;
        }
        return obj.at(key).get<double>();
    }

    std::optional<bool> optional_bool_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_boolean()) {
            return std::nullopt;
        }
        return obj.at(key).get<bool>();
    }

    std::optional<std::vector<std::string>> optional_string_array_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_array()) {
            return std::nullopt;
        }
        std::vector<std::string> values;
        for (const auto& entry : obj.at(key)) {
            if (entry.is_string()) {
                values.push_back(entry.get<std::string>());
            }
        }
        return values;
    }

}
