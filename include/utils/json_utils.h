// json_utils.h - helpers for safe JSON parsing and extraction
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ontoreg {

// Parse JSON string; returns std::nullopt on error and fills error message if provided.
std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error = nullptr);

// String member of an object; absent, null and non-string values give std::nullopt.
std::optional<std::string> optional_string(const nlohmann::json& j, const std::string& key);

}  // namespace ontoreg
