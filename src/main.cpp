#include <iostream>
#include <signal.h>
#include <string>
#include <spdlog/spdlog.h>

#include "cli/commands.h"
#include "cli/messages.h"
#include "runtime/state.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace {

void signalHandler(int) {
    sitemirror::request_shutdown();
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = sitemirror::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }
    if (cli_result.subcommand == sitemirror::Subcommand::None) {
        std::cout << sitemirror::getHelpMessage(cli_result.lang);
        return 0;
    }

    sitemirror::logger::init_from_env();
    auto [cfg, cfg_log] = sitemirror::loadMirrorConfigWithLog();
    spdlog::info("sitemirror {} {}: config {}", SITEMIRROR_VERSION,
                 sitemirror::subcommandToString(cli_result.subcommand), cfg_log);

    const auto lang = sitemirror::cli::resolveLanguage(cli_result.lang, cfg.lang);

    switch (cli_result.subcommand) {
        case sitemirror::Subcommand::Download:
            return sitemirror::cli::commands::download(cfg, cli_result.download_options, lang);

        case sitemirror::Subcommand::Serve:
            // A download batch runs to completion or dies with the process; only serve drains.
            signal(SIGINT, signalHandler);
            signal(SIGTERM, signalHandler);
            return sitemirror::cli::commands::serve(cfg, cli_result.serve_options, lang);

        case sitemirror::Subcommand::Status:
            return sitemirror::cli::commands::status(cfg, lang);

        case sitemirror::Subcommand::None:
        default:
            return 0;
    }
}
