// ontoreg show: print the path of a cached ontology

#include "cli/commands.h"
#include "cli/registry_session.h"
#include <iostream>

namespace ontoreg {
namespace cli {
namespace commands {

int show(const OntologyOptions& options) {
    if (options.ontology_id.empty()) {
        std::cerr << "Error: ontology id required" << std::endl;
        return 1;
    }

    auto registry = openRegistry(options.registry_dir);
    const auto version = Version::parse(options.version);

    auto path = registry->get(options.ontology_id, version, options.format);
    if (!path) {
        std::cerr << "Error: '" << options.ontology_id << "' (" << version << ", "
                  << to_string(options.format) << ") is not registered" << std::endl;
        return 1;
    }

    std::cout << path->string() << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace ontoreg
