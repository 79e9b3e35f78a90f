// CLI command function declarations
#pragma once

#include "utils/cli.h"

namespace ontoreg {
namespace cli {
namespace commands {

/// Execute the 'pull' command
/// @param options Ontology id, version, format
/// @return Exit code (0=success, 1=error)
int pull(const OntologyOptions& options);

/// Execute the 'list' command
/// @return Exit code (0=success, 1=error)
int list(const ListOptions& options);

/// Execute the 'show' command
/// @return Exit code (0=success, 1=not registered)
int show(const OntologyOptions& options);

/// Execute the 'rm' command
/// @return Exit code (0=success, 1=error)
int rm(const OntologyOptions& options);

}  // namespace commands
}  // namespace cli
}  // namespace ontoreg
