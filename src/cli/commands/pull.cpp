// ontoreg pull: download an ontology into the registry

#include "cli/commands.h"
#include "cli/registry_session.h"
#include <iostream>

namespace ontoreg {
namespace cli {
namespace commands {

/// Execute the 'pull' command
/// @param options Ontology id, version, format
/// @return Exit code (0=success, 1=error)
int pull(const OntologyOptions& options) {
    if (options.ontology_id.empty()) {
        std::cerr << "Error: ontology id required" << std::endl;
        return 1;
    }

    auto registry = openRegistry(options.registry_dir);
    const auto version = Version::parse(options.version);

    auto result = registry->registerOntology(options.ontology_id, version, options.format);
    if (!result.ok()) {
        std::cerr << "Error: " << describeError(result) << std::endl;
        return 1;
    }

    std::cout << result.data->string() << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace ontoreg
