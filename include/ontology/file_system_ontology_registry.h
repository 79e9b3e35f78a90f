// FileSystemOntologyRegistry - flat on-disk cache of ontology artifacts
// Layout: <registry_path>/<id>_<version><suffix>
#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ontology/ontology_providers.h"
#include "ontology/ontology_registry.h"

namespace ontoreg {

class FileSystemOntologyRegistry : public OntologyRegistry {
public:
    FileSystemOntologyRegistry(std::filesystem::path registry_path,
                               std::shared_ptr<const OntologyMetadataProvider> metadata_provider,
                               std::shared_ptr<const OntologyProvider> ontology_provider);

    // Fetches on a miss. The fetch runs outside the write lock; only the
    // temp-write + rename is serialized. A file visible under the canonical
    // name is always complete.
    RegistryResult<std::filesystem::path> registerOntology(const std::string& ontology_id,
                                                           const Version& version,
                                                           FileType file_type) override;

    RegistryResult<void> unregisterOntology(const std::string& ontology_id,
                                            const Version& version,
                                            FileType file_type) override;

    // Lock-free: writers publish through rename only.
    std::optional<std::filesystem::path> get(const std::string& ontology_id,
                                             const Version& version,
                                             FileType file_type) const override;

    // Absolute paths of regular files directly under the registry root, sorted.
    std::vector<std::string> list() const override;

    // "<id>_<version><suffix>"
    static std::string registryFileName(const std::string& ontology_id,
                                        const std::string& version,
                                        FileType file_type);

    // "<id><suffix>", the name the content provider is asked for.
    static std::string providerFileName(const std::string& ontology_id, FileType file_type);

    RegistryResult<std::string> resolveVersion(const std::string& ontology_id,
                                               const Version& version) const;

private:
    std::filesystem::path registry_path_;
    std::shared_ptr<const OntologyMetadataProvider> metadata_provider_;
    std::shared_ptr<const OntologyProvider> ontology_provider_;
    std::mutex write_mutex_;
};

}  // namespace ontoreg
