#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace ontoreg {

struct RegistryConfig {
    std::string registry_dir;
    std::string bioregistry_url{"https://bioregistry.io/api/"};
    std::string obo_library_url{"https://purl.obolibrary.org/obo"};
    std::chrono::milliseconds http_timeout{30000};
};

// Sources, lowest priority first: defaults, JSON file ($ONTOREG_CONFIG or
// ~/.ontoreg/config.json), environment (ONTOREG_REGISTRY_DIR,
// ONTOREG_BIOREGISTRY_URL, ONTOREG_OBO_URL, ONTOREG_HTTP_TIMEOUT_MS).
RegistryConfig loadRegistryConfig();

// Same as loadRegistryConfig(); the second member describes which sources
// were applied, e.g. "file=... env:REGISTRY_DIR=/x |sources=env,file".
std::pair<RegistryConfig, std::string> loadRegistryConfigWithLog();

// ~/.ontoreg (empty when HOME is not set)
std::string defaultDataDir();

}  // namespace ontoreg
