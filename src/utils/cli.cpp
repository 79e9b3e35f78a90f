#include "utils/cli.h"
#include "utils/version.h"
#include <cstring>
#include <sstream>

namespace ontoreg {

namespace {

std::string getOntologyCommandHelp(const char* name, const char* summary, const char* extra) {
    std::ostringstream oss;
    oss << "ontoreg " << name << " - " << summary << "\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ontoreg " << name << " <ID> [OPTIONS]\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    <ID>                    Ontology identifier (e.g., go, hp, uo)\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --version <VERSION>     Release version or 'latest' (default: latest)\n";
    oss << "    --format <FORMAT>       json | obo | owl (default: owl)\n";
    oss << "    --registry-dir <DIR>    Registry directory (default: ONTOREG_REGISTRY_DIR or\n";
    oss << "                            ~/.ontoreg/ontologies)\n";
    oss << "    -h, --help              Print help\n";
    if (extra && *extra) {
        oss << "\n" << extra;
    }
    return oss.str();
}

std::string getPullHelpMessage() {
    return getOntologyCommandHelp(
        "pull", "Download an ontology into the registry",
        "Prints the path of the cached file. Nothing is downloaded when it is already cached.\n");
}

std::string getShowHelpMessage() {
    return getOntologyCommandHelp("show", "Print the path of a cached ontology", "");
}

std::string getRmHelpMessage() {
    return getOntologyCommandHelp("rm", "Remove a cached ontology", "");
}

std::string getListHelpMessage() {
    std::ostringstream oss;
    oss << "ontoreg list - List cached ontology files\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ontoreg list [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --registry-dir <DIR>    Registry directory\n";
    oss << "    -h, --help              Print help\n";
    return oss.str();
}

bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

void fail(CliResult& result, const std::string& message, const char* usage) {
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\nUsage: " + usage + "\n";
}

void parseOntologyCommand(int argc, char* argv[], CliResult& result, const char* usage) {
    auto& options = result.ontology_options;
    for (int i = 2; i < argc; ++i) {
        const bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "--version") == 0) {
            if (!has_value) return fail(result, "--version requires a value", usage);
            options.version = argv[++i];
        } else if (std::strcmp(argv[i], "--format") == 0) {
            if (!has_value) return fail(result, "--format requires a value", usage);
            auto format = parseFileType(argv[++i]);
            if (!format) {
                return fail(result, std::string("unsupported format '") + argv[i] + "' (json, obo, owl)", usage);
            }
            options.format = *format;
        } else if (std::strcmp(argv[i], "--registry-dir") == 0) {
            if (!has_value) return fail(result, "--registry-dir requires a value", usage);
            options.registry_dir = argv[++i];
        } else if (argv[i][0] == '-') {
            return fail(result, std::string("unknown option '") + argv[i] + "'", usage);
        } else if (options.ontology_id.empty()) {
            options.ontology_id = argv[i];
        } else {
            return fail(result, std::string("unexpected argument '") + argv[i] + "'", usage);
        }
    }

    if (options.ontology_id.empty()) {
        fail(result, "ontology id required", usage);
    }
}

}  // namespace

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "ontoreg " << ONTOREG_VERSION << " - local ontology registry\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ontoreg <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    pull       Download an ontology into the registry\n";
    oss << "    list       List cached ontology files\n";
    oss << "    show       Print the path of a cached ontology\n";
    oss << "    rm         Remove a cached ontology\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    ONTOREG_CONFIG              Config file path (default: ~/.ontoreg/config.json)\n";
    oss << "    ONTOREG_REGISTRY_DIR        Registry directory\n";
    oss << "    ONTOREG_BIOREGISTRY_URL     Metadata API base URL\n";
    oss << "    ONTOREG_OBO_URL             Ontology download base URL\n";
    oss << "    ONTOREG_HTTP_TIMEOUT_MS     HTTP timeout in milliseconds\n";
    oss << "    ONTOREG_LOG_LEVEL           Log level (trace|debug|info|warn|error)\n";
    oss << "    ONTOREG_LOG_DIR             Log directory (default: ~/.ontoreg/logs)\n";
    oss << "\n";
    oss << "Run 'ontoreg <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "ontoreg " << ONTOREG_VERSION << "\n";
    return oss.str();
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    if (argc < 2) {
        result.should_exit = true;
        result.exit_code = 1;
        result.output = getHelpMessage();
        return result;
    }

    const char* command = argv[1];

    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "pull") == 0) {
        result.subcommand = Subcommand::Pull;
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.output = getPullHelpMessage();
            return result;
        }
        parseOntologyCommand(argc, argv, result, "ontoreg pull <ID> [--version <VERSION>] [--format <FORMAT>]");
        return result;
    }

    if (std::strcmp(command, "show") == 0) {
        result.subcommand = Subcommand::Show;
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.output = getShowHelpMessage();
            return result;
        }
        parseOntologyCommand(argc, argv, result, "ontoreg show <ID> [--version <VERSION>] [--format <FORMAT>]");
        return result;
    }

    if (std::strcmp(command, "rm") == 0) {
        result.subcommand = Subcommand::Rm;
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.output = getRmHelpMessage();
            return result;
        }
        parseOntologyCommand(argc, argv, result, "ontoreg rm <ID> [--version <VERSION>] [--format <FORMAT>]");
        return result;
    }

    if (std::strcmp(command, "list") == 0) {
        result.subcommand = Subcommand::List;
        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.output = getListHelpMessage();
            return result;
        }
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--registry-dir") == 0 && i + 1 < argc) {
                result.list_options.registry_dir = argv[++i];
            } else {
                fail(result, std::string("unexpected argument '") + argv[i] + "'", "ontoreg list [--registry-dir <DIR>]");
                return result;
            }
        }
        return result;
    }

    // Check for unknown flags (starting with - or --)
    if (command[0] == '-') {
        result.should_exit = true;
        result.exit_code = 1;
        std::ostringstream oss;
        oss << "Unknown option: " << command << "\n\n";
        oss << getHelpMessage();
        result.output = oss.str();
        return result;
    }

    // Unknown command
    result.should_exit = true;
    result.exit_code = 1;
    std::ostringstream oss;
    oss << "Unknown command: " << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Pull: return "pull";
        case Subcommand::List: return "list";
        case Subcommand::Show: return "show";
        case Subcommand::Rm: return "rm";
    }
    return "unknown";
}

}  // namespace ontoreg
