#pragma once

#include <string>

#include "ontology/ontology_types.h"
#include "ontology/registry_error.h"

namespace ontoreg {

// Source of ontology metadata. Used by the registry to resolve
// Version::latest() into a concrete version string.
// Implementations are called concurrently and must be thread-safe.
class OntologyMetadataProvider {
public:
    virtual ~OntologyMetadataProvider() = default;

    // On success the metadata carries a non-empty version.
    virtual RegistryResult<OntologyMetadata> provideMetadata(const std::string& ontology_id) const = 0;
};

// Source of raw ontology artifacts.
// file_name is "<id><suffix>" (e.g. "go.owl"); the version is passed
// separately and locates the release the file belongs to.
// Implementations are called concurrently and must be thread-safe.
class OntologyProvider {
public:
    virtual ~OntologyProvider() = default;

    virtual RegistryResult<std::string> provideOntology(const std::string& ontology_id,
                                                        const std::string& file_name,
                                                        const std::string& version) const = 0;
};

}  // namespace ontoreg
