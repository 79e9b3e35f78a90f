#include <iostream>

#include "cli/commands.h"
#include "utils/cli.h"
#include "utils/logger.h"

int main(int argc, char* argv[]) {
    auto cli_result = ontoreg::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    ontoreg::logger::init_from_env();

    switch (cli_result.subcommand) {
        case ontoreg::Subcommand::Pull:
            return ontoreg::cli::commands::pull(cli_result.ontology_options);

        case ontoreg::Subcommand::List:
            return ontoreg::cli::commands::list(cli_result.list_options);

        case ontoreg::Subcommand::Show:
            return ontoreg::cli::commands::show(cli_result.ontology_options);

        case ontoreg::Subcommand::Rm:
            return ontoreg::cli::commands::rm(cli_result.ontology_options);

        case ontoreg::Subcommand::None:
        default:
            std::cerr << ontoreg::getHelpMessage();
            return 1;
    }
}
