#pragma once

#include <memory>
#include <string>

#include "ontology/ontology_registry.h"
#include "utils/config.h"

namespace ontoreg {
namespace cli {

// Registry wired to the bioregistry metadata API and the OBO PURL tree.
// registry_dir_override replaces cfg.registry_dir when not empty.
std::unique_ptr<OntologyRegistry> openRegistry(const RegistryConfig& cfg,
                                                         const std::string& registry_dir_override = {});

// Same, using loadRegistryConfig().
std::unique_ptr<OntologyRegistry> openRegistry(const std::string& registry_dir_override = {});

}  // namespace cli
}  // namespace ontoreg
