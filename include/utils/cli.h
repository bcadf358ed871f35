#pragma once

#include <cstdint>
#include <string>

namespace sitemirror {

/// Subcommand types for the sitemirror CLI
enum class Subcommand {
    None,      // No subcommand (print usage)
    Download,  // download
    Serve,     // serve
    Status,    // status
};

/// Options for the download command. Zero means "use the configured value".
struct DownloadOptions {
    size_t workers{0};
    int retries{0};
};

/// Options for the serve command
struct ServeOptions {
    uint16_t port{0};  // 0: configured port
    std::string cert;
    std::string key;
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    /// Value of --lang ("zh", "en") or empty
    std::string lang;

    Subcommand subcommand{Subcommand::None};
    DownloadOptions download_options;
    ServeOptions serve_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Help text in the language selected by --lang, config or locale
std::string getHelpMessage(const std::string& lang = "");

std::string getVersionMessage();

std::string subcommandToString(Subcommand cmd);

}  // namespace sitemirror
