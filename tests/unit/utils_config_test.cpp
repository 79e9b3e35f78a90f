#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <unordered_map>
#include <vector>

#include "utils/config.h"

using namespace ontoreg;
namespace fs = std::filesystem;

class EnvGuard {
public:
    EnvGuard(const std::vector<std::string>& keys) : keys_(keys) {
        for (const auto& k : keys_) {
            const char* v = std::getenv(k.c_str());
            if (v) saved_[k] = v;
        }
    }
    ~EnvGuard() {
        for (const auto& k : keys_) {
            if (auto it = saved_.find(k); it != saved_.end()) {
                setenv(k.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(k.c_str());
            }
        }
    }
private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

namespace {
const std::vector<std::string> kAllKeys = {"ONTOREG_CONFIG", "ONTOREG_REGISTRY_DIR", "ONTOREG_BIOREGISTRY_URL",
                                           "ONTOREG_OBO_URL", "ONTOREG_HTTP_TIMEOUT_MS", "HOME"};

void clearRegistryEnv() {
    for (const auto& k : kAllKeys) {
        if (k != "HOME") unsetenv(k.c_str());
    }
}
}  // namespace

TEST(UtilsConfigTest, DefaultsUseHomeDataDir) {
    EnvGuard guard(kAllKeys);
    clearRegistryEnv();

    fs::path home = fs::temp_directory_path() / "ontoreg-home-defaults";
    fs::remove_all(home);
    fs::create_directories(home);
    setenv("HOME", home.string().c_str(), 1);

    auto info = loadRegistryConfigWithLog();
    auto cfg = info.first;

    EXPECT_EQ(cfg.registry_dir, (home / ".ontoreg" / "ontologies").string());
    EXPECT_EQ(cfg.bioregistry_url, "https://bioregistry.io/api/");
    EXPECT_EQ(cfg.obo_library_url, "https://purl.obolibrary.org/obo");
    EXPECT_EQ(cfg.http_timeout.count(), 30000);
    EXPECT_NE(info.second.find("sources=default"), std::string::npos);
    EXPECT_EQ(defaultDataDir(), (home / ".ontoreg").string());

    fs::remove_all(home);
}

TEST(UtilsConfigTest, LoadsRegistryConfigFromFile) {
    EnvGuard guard(kAllKeys);
    clearRegistryEnv();

    fs::path tmp = fs::temp_directory_path() / "ontoreg-cfg.json";
    std::ofstream(tmp) << R"({
        "registry_dir": "/tmp/ontologies",
        "bioregistry_url": "http://127.0.0.1:9/api/",
        "obo_library_url": "http://127.0.0.1:9/obo",
        "http_timeout_ms": 1500
    })";
    setenv("ONTOREG_CONFIG", tmp.string().c_str(), 1);

    auto info = loadRegistryConfigWithLog();
    auto cfg = info.first;

    EXPECT_EQ(cfg.registry_dir, "/tmp/ontologies");
    EXPECT_EQ(cfg.bioregistry_url, "http://127.0.0.1:9/api/");
    EXPECT_EQ(cfg.obo_library_url, "http://127.0.0.1:9/obo");
    EXPECT_EQ(cfg.http_timeout.count(), 1500);
    EXPECT_NE(info.second.find("file="), std::string::npos);
    EXPECT_NE(info.second.find("sources=file"), std::string::npos);

    fs::remove(tmp);
}

TEST(UtilsConfigTest, EnvOverridesFileConfig) {
    EnvGuard guard(kAllKeys);
    clearRegistryEnv();

    fs::path tmp = fs::temp_directory_path() / "ontoreg-cfg-env.json";
    std::ofstream(tmp) << R"({"registry_dir": "/file/ontologies", "http_timeout_ms": 1500})";
    setenv("ONTOREG_CONFIG", tmp.string().c_str(), 1);
    setenv("ONTOREG_REGISTRY_DIR", "/env/ontologies", 1);
    setenv("ONTOREG_OBO_URL", "http://mirror.local/obo", 1);
    setenv("ONTOREG_HTTP_TIMEOUT_MS", "2500", 1);

    auto info = loadRegistryConfigWithLog();
    auto cfg = info.first;

    EXPECT_EQ(cfg.registry_dir, "/env/ontologies");
    EXPECT_EQ(cfg.obo_library_url, "http://mirror.local/obo");
    EXPECT_EQ(cfg.http_timeout.count(), 2500);
    EXPECT_NE(info.second.find("sources=env,file"), std::string::npos);

    fs::remove(tmp);
}

TEST(UtilsConfigTest, InvalidValuesAreIgnored) {
    EnvGuard guard(kAllKeys);
    clearRegistryEnv();

    fs::path tmp = fs::temp_directory_path() / "ontoreg-cfg-invalid.json";
    std::ofstream(tmp) << R"({"registry_dir": 42, "http_timeout_ms": -5})";
    setenv("ONTOREG_CONFIG", tmp.string().c_str(), 1);
    setenv("ONTOREG_HTTP_TIMEOUT_MS", "soon", 1);
    setenv("ONTOREG_REGISTRY_DIR", "", 1);

    auto cfg = loadRegistryConfig();

    EXPECT_FALSE(cfg.registry_dir.empty());
    EXPECT_NE(cfg.registry_dir, "42");
    EXPECT_EQ(cfg.http_timeout.count(), 30000);

    fs::remove(tmp);
}

TEST(UtilsConfigTest, MalformedConfigFileFallsBackToDefaults) {
    EnvGuard guard(kAllKeys);
    clearRegistryEnv();

    fs::path tmp = fs::temp_directory_path() / "ontoreg-cfg-broken.json";
    std::ofstream(tmp) << "{ not json";
    setenv("ONTOREG_CONFIG", tmp.string().c_str(), 1);

    auto info = loadRegistryConfigWithLog();

    EXPECT_EQ(info.first.bioregistry_url, "https://bioregistry.io/api/");
    EXPECT_EQ(info.second.find("file="), std::string::npos);

    fs::remove(tmp);
}

TEST(UtilsConfigTest, DefaultConfigPathIsOntoregDir) {
    EnvGuard guard(kAllKeys);
    clearRegistryEnv();

    fs::path home = fs::temp_directory_path() / "ontoreg-home-config";
    fs::remove_all(home);
    fs::create_directories(home / ".ontoreg");
    std::ofstream(home / ".ontoreg" / "config.json") << R"({"registry_dir": "/from/home/config"})";
    setenv("HOME", home.string().c_str(), 1);

    auto cfg = loadRegistryConfig();
    EXPECT_EQ(cfg.registry_dir, "/from/home/config");

    fs::remove_all(home);
}
