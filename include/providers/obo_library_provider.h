#pragma once

#include <chrono>
#include <string>

#include "ontology/ontology_providers.h"

namespace ontoreg {

// Ontology releases from the OBO Foundry PURL tree:
// GET <base_url>/<id>/releases/<version>/<file_name>
// PURLs answer with redirects, which the client follows.
class OboLibraryProvider : public OntologyProvider {
public:
    static constexpr const char* kDefaultBaseUrl = "https://purl.obolibrary.org/obo";

    explicit OboLibraryProvider(std::string base_url = kDefaultBaseUrl,
                                std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    RegistryResult<std::string> provideOntology(const std::string& ontology_id,
                                                const std::string& file_name,
                                                const std::string& version) const override;

    const std::string& baseUrl() const { return base_url_; }

private:
    std::string base_url_;
    std::chrono::milliseconds timeout_;
};

}  // namespace ontoreg
