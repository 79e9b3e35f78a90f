#pragma once

#include <filesystem>
#include <string>

#include "ontology/ontology_providers.h"

namespace ontoreg {

// Reads releases from a local copy of the OBO PURL tree:
// <root>/<id>/releases/<version>/<file_name>
class LocalMirrorOntologyProvider : public OntologyProvider {
public:
    explicit LocalMirrorOntologyProvider(std::filesystem::path root);

    RegistryResult<std::string> provideOntology(const std::string& ontology_id,
                                                const std::string& file_name,
                                                const std::string& version) const override;

    std::filesystem::path releasePath(const std::string& ontology_id,
                                      const std::string& file_name,
                                      const std::string& version) const;

private:
    std::filesystem::path root_;
};

}  // namespace ontoreg
