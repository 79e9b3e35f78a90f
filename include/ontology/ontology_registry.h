#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ontology/ontology_types.h"
#include "ontology/registry_error.h"

namespace ontoreg {

class OntologyRegistry {
public:
    virtual ~OntologyRegistry() = default;

    // Ensure the artifact is cached locally and return its path.
    virtual RegistryResult<std::filesystem::path> registerOntology(const std::string& ontology_id,
                                                                   const Version& version,
                                                                   FileType file_type) = 0;

    // Remove a cached artifact. Removing an absent artifact succeeds.
    virtual RegistryResult<void> unregisterOntology(const std::string& ontology_id,
                                                    const Version& version,
                                                    FileType file_type) = 0;

    // Path of a cached artifact, or std::nullopt when it is not cached
    // (or "latest" could not be resolved).
    virtual std::optional<std::filesystem::path> get(const std::string& ontology_id,
                                                     const Version& version,
                                                     FileType file_type) const = 0;

    // Every cached file.
    virtual std::vector<std::string> list() const = 0;
};

}  // namespace ontoreg
