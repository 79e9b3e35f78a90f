#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

#include "providers/local_mirror_ontology_provider.h"
#include "providers/static_providers.h"

using namespace ontoreg;
namespace fs = std::filesystem;

namespace {
class TempDir {
public:
    TempDir() {
        auto base = fs::temp_directory_path() / fs::path("ontoreg-mirror-XXXXXX");
        std::string tmpl = base.string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* created = mkdtemp(buf.data());
        path = created ? fs::path(created) : fs::temp_directory_path() / "ontoreg-mirror";
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    fs::path path;
};
}  // namespace

TEST(StaticProvidersTest, MetadataForKnownId) {
    StaticMetadataProvider provider(std::unordered_map<std::string, std::string>{{"uo", "2026-01-16"}});

    auto result = provider.provideMetadata("uo");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.data->ontology_id, "uo");
    EXPECT_EQ(result.data->version, "2026-01-16");
}

TEST(StaticProvidersTest, MetadataForUnknownIdFails) {
    StaticMetadataProvider provider;
    provider.withVersion("go", "1");

    auto result = provider.provideMetadata("chebi");

    EXPECT_EQ(result.error, RegistryErrorCode::kProvidingMetadata);
    EXPECT_EQ(result.error_message, "Metadata not found for chebi");
}

TEST(StaticProvidersTest, ContentIgnoresVersionAndFileName) {
    StaticOntologyProvider provider;
    provider.withContent("go", "<owl/>");

    auto a = provider.provideOntology("go", "go.owl", "1");
    auto b = provider.provideOntology("go", "go.obo", "2");

    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(*a.data, "<owl/>");
    EXPECT_EQ(*b.data, "<owl/>");

    auto missing = provider.provideOntology("hp", "hp.owl", "1");
    EXPECT_EQ(missing.error, RegistryErrorCode::kProvidingOntology);
    EXPECT_EQ(missing.error_message, "Content not found for hp");
}

TEST(LocalMirrorOntologyProviderTest, ReadsReleaseFile) {
    TempDir temp;
    const auto release_dir = temp.path / "uo" / "releases" / "2026-01-16";
    fs::create_directories(release_dir);
    std::ofstream(release_dir / "uo.json", std::ios::binary) << "{\"graphs\":[]}";
    LocalMirrorOntologyProvider provider(temp.path);

    EXPECT_EQ(provider.releasePath("uo", "uo.json", "2026-01-16"), release_dir / "uo.json");
    auto result = provider.provideOntology("uo", "uo.json", "2026-01-16");

    ASSERT_TRUE(result.ok()) << result.error_message;
    EXPECT_EQ(*result.data, "{\"graphs\":[]}");
}

TEST(LocalMirrorOntologyProviderTest, MissingReleaseFails) {
    TempDir temp;
    LocalMirrorOntologyProvider provider(temp.path);

    auto result = provider.provideOntology("uo", "uo.owl", "1");

    EXPECT_EQ(result.error, RegistryErrorCode::kProvidingOntology);
    EXPECT_NE(result.error_message.find("uo.owl"), std::string::npos);
}

TEST(LocalMirrorOntologyProviderTest, DirectoryAtReleasePathFails) {
    TempDir temp;
    fs::create_directories(temp.path / "go" / "releases" / "1" / "go.owl");
    LocalMirrorOntologyProvider provider(temp.path);

    EXPECT_FALSE(provider.provideOntology("go", "go.owl", "1").ok());
}
