#pragma once

#include <string>

#include "ontology/ontology_types.h"

namespace ontoreg {

/// Subcommand types for the ontoreg CLI
enum class Subcommand {
    None,  // No subcommand
    Pull,  // pull <id>
    List,  // list
    Show,  // show <id>
    Rm,    // rm <id>
};

/// Options for commands addressing one cached artifact (pull, show, rm)
struct OntologyOptions {
    std::string ontology_id;
    std::string version{"latest"};
    FileType format{FileType::Owl};
    std::string registry_dir;  // Overrides the configured registry directory when set
};

/// Options for list command
struct ListOptions {
    std::string registry_dir;
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    /// Parsed subcommand
    Subcommand subcommand{Subcommand::None};

    /// Options for pull, show and rm
    OntologyOptions ontology_options;

    /// Options for list
    ListOptions list_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace ontoreg
