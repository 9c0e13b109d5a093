// src/cli/uctsearch_cli.cpp
#include "cli/cli_manager.h"
#include "cli/play_command.h"
#include "utils/logger.h"

#ifndef UCTSEARCH_VERSION
#define UCTSEARCH_VERSION "unknown"
#endif

int main(int argc, char** argv) {
    uctsearch::cli::CLIManager cli("uctsearch", UCTSEARCH_VERSION);

    cli.addCommand("play",
                   "Play tic-tac-toe against the search engine",
                   uctsearch::cli::runPlayCommand,
                   "[config.yaml]");

    int status = cli.run(argc, argv);
    uctsearch::utils::Logger::shutdown();
    return status;
}
