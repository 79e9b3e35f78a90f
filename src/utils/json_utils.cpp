#include "utils/json_utils.h"

namespace ontoreg {

std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& ex) {
        if (error) *error = ex.what();
        return std::nullopt;
    }
}

std::optional<std::string> optional_string(const nlohmann::json& j, const std::string& key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

}  // namespace ontoreg
