// In-memory providers backed by lookup tables (offline use, fixtures).
#pragma once

#include <string>
#include <unordered_map>

#include "ontology/ontology_providers.h"

namespace ontoreg {

class StaticMetadataProvider : public OntologyMetadataProvider {
public:
    StaticMetadataProvider() = default;
    explicit StaticMetadataProvider(std::unordered_map<std::string, std::string> versions);

    StaticMetadataProvider& withVersion(const std::string& ontology_id, const std::string& version);

    RegistryResult<OntologyMetadata> provideMetadata(const std::string& ontology_id) const override;

private:
    std::unordered_map<std::string, std::string> versions_;
};

// Same content for every version and file name of an ontology id.
class StaticOntologyProvider : public OntologyProvider {
public:
    StaticOntologyProvider() = default;
    explicit StaticOntologyProvider(std::unordered_map<std::string, std::string> contents);

    StaticOntologyProvider& withContent(const std::string& ontology_id, const std::string& content);

    RegistryResult<std::string> provideOntology(const std::string& ontology_id,
                                                const std::string& file_name,
                                                const std::string& version) const override;

private:
    std::unordered_map<std::string, std::string> contents_;
};

}  // namespace ontoreg
