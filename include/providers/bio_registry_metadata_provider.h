#pragma once

#include <chrono>
#include <string>

#include "ontology/ontology_providers.h"

namespace ontoreg {

// Metadata from the bioregistry.io REST API: GET <api_url>registry/<id>
class BioRegistryMetadataProvider : public OntologyMetadataProvider {
public:
    static constexpr const char* kDefaultApiUrl = "https://bioregistry.io/api/";

    explicit BioRegistryMetadataProvider(std::string api_url = kDefaultApiUrl,
                                         std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    RegistryResult<OntologyMetadata> provideMetadata(const std::string& ontology_id) const override;

    // Always ends with '/'.
    const std::string& apiUrl() const { return api_url_; }

    // Map a bioregistry resource document onto OntologyMetadata.
    static RegistryResult<OntologyMetadata> parseResource(const std::string& ontology_id,
                                                          const std::string& body);

private:
    std::string api_url_;
    std::chrono::milliseconds timeout_;
};

}  // namespace ontoreg
