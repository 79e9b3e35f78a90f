#include "providers/static_providers.h"

#include <utility>

namespace ontoreg {

StaticMetadataProvider::StaticMetadataProvider(std::unordered_map<std::string, std::string> versions)
    : versions_(std::move(versions)) {}

StaticMetadataProvider& StaticMetadataProvider::withVersion(const std::string& ontology_id,
                                                            const std::string& version) {
    versions_[ontology_id] = version;
    return *this;
}

RegistryResult<OntologyMetadata> StaticMetadataProvider::provideMetadata(const std::string& ontology_id) const {
    auto it = versions_.find(ontology_id);
    if (it == versions_.end()) {
        return registryFailure<OntologyMetadata>(RegistryErrorCode::kProvidingMetadata,
                                                 "Metadata not found for " + ontology_id);
    }
    OntologyMetadata metadata;
    metadata.ontology_id = ontology_id;
    metadata.version = it->second;
    return registrySuccess(std::move(metadata));
}

StaticOntologyProvider::StaticOntologyProvider(std::unordered_map<std::string, std::string> contents)
    : contents_(std::move(contents)) {}

StaticOntologyProvider& StaticOntologyProvider::withContent(const std::string& ontology_id,
                                                            const std::string& content) {
    contents_[ontology_id] = content;
    return *this;
}

RegistryResult<std::string> StaticOntologyProvider::provideOntology(const std::string& ontology_id,
                                                                    const std::string& /* file_name */,
                                                                    const std::string& /* version */) const {
    auto it = contents_.find(ontology_id);
    if (it == contents_.end()) {
        return registryFailure<std::string>(RegistryErrorCode::kProvidingOntology,
                                            "Content not found for " + ontology_id);
    }
    return registrySuccess(it->second);
}

}  // namespace ontoreg
