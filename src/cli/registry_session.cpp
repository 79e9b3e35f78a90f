#include "cli/registry_session.h"

#include <spdlog/spdlog.h>

#include "ontology/file_system_ontology_registry.h"
#include "providers/bio_registry_metadata_provider.h"
#include "providers/obo_library_provider.h"

namespace ontoreg {
namespace cli {

std::unique_ptr<OntologyRegistry> openRegistry(const RegistryConfig& cfg,
                                                         const std::string& registry_dir_override) {
    const std::string registry_dir = registry_dir_override.empty() ? cfg.registry_dir : registry_dir_override;
    spdlog::debug("Opening registry dir='{}' metadata='{}' ontologies='{}'", registry_dir,
                  cfg.bioregistry_url, cfg.obo_library_url);

    return std::make_unique<FileSystemOntologyRegistry>(
        registry_dir,
        std::make_shared<BioRegistryMetadataProvider>(cfg.bioregistry_url, cfg.http_timeout),
        std::make_shared<OboLibraryProvider>(cfg.obo_library_url, cfg.http_timeout));
}

std::unique_ptr<OntologyRegistry> openRegistry(const std::string& registry_dir_override) {
    auto cfg_pair = loadRegistryConfigWithLog();
    spdlog::debug("Registry config: {}", cfg_pair.second);
    return openRegistry(cfg_pair.first, registry_dir_override);
}

}  // namespace cli
}  // namespace ontoreg
