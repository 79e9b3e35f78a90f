#include "utils/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ontoreg {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::filesystem::path defaultConfigPath() {
    const auto data_dir = defaultDataDir();
    if (data_dir.empty()) return std::filesystem::path();
    return std::filesystem::path(data_dir) / "config.json";
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    try {
        ifs >> out;
        return true;
    } catch (const nlohmann::json::exception& ex) {
        spdlog::warn("Ignoring unreadable config file '{}': {}", path.string(), ex.what());
        return false;
    }
}

std::optional<long long> parsePositive(const std::string& text) {
    try {
        size_t consumed = 0;
        long long v = std::stoll(text, &consumed);
        if (consumed != text.size() || v <= 0) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

std::string defaultDataDir() {
    auto home = getEnvValue("HOME").value_or("");
    if (home.empty()) return "";
    return (std::filesystem::path(home) / ".ontoreg").string();
}

std::pair<RegistryConfig, std::string> loadRegistryConfigWithLog() {
    RegistryConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    // defaults: ~/.ontoreg/ontologies
    const auto data_dir = defaultDataDir();
    cfg.registry_dir = data_dir.empty() ? ".ontoreg/ontologies"
                                        : (std::filesystem::path(data_dir) / "ontologies").string();

    auto apply_json = [&](const nlohmann::json& j) {
        if (!j.is_object()) return;
        if (j.contains("registry_dir") && j["registry_dir"].is_string()) {
            cfg.registry_dir = j["registry_dir"].get<std::string>();
        }
        if (j.contains("bioregistry_url") && j["bioregistry_url"].is_string()) {
            cfg.bioregistry_url = j["bioregistry_url"].get<std::string>();
        }
        if (j.contains("obo_library_url") && j["obo_library_url"].is_string()) {
            cfg.obo_library_url = j["obo_library_url"].get<std::string>();
        }
        if (j.contains("http_timeout_ms") && j["http_timeout_ms"].is_number_integer()) {
            const auto ms = j["http_timeout_ms"].get<long long>();
            if (ms > 0) cfg.http_timeout = std::chrono::milliseconds(ms);
        }
    };

    // file
    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("ONTOREG_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }

    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJson(cfg_path, j)) {
            apply_json(j);
            log << "file=" << cfg_path.string() << " ";
            used_file = true;
        }
    }

    // env overrides
    if (auto v = getEnvValue("ONTOREG_REGISTRY_DIR")) {
        if (!v->empty()) {
            cfg.registry_dir = *v;
            log << "env:REGISTRY_DIR=" << *v << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("ONTOREG_BIOREGISTRY_URL")) {
        if (!v->empty()) {
            cfg.bioregistry_url = *v;
            log << "env:BIOREGISTRY_URL=" << *v << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("ONTOREG_OBO_URL")) {
        if (!v->empty()) {
            cfg.obo_library_url = *v;
            log << "env:OBO_URL=" << *v << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("ONTOREG_HTTP_TIMEOUT_MS")) {
        if (auto ms = parsePositive(*v)) {
            cfg.http_timeout = std::chrono::milliseconds(*ms);
            log << "env:HTTP_TIMEOUT_MS=" << *ms << " ";
            used_env = true;
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

RegistryConfig loadRegistryConfig() {
    auto info = loadRegistryConfigWithLog();
    return info.first;
}

}  // namespace ontoreg
