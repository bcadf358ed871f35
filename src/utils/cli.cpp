#include "utils/cli.h"
#include "utils/version.h"
#include "cli/messages.h"
#include <optional>
#include <sstream>
#include <vector>

namespace sitemirror {

namespace {

using cli::Language;
using cli::tr;

std::optional<long> parseNumber(const std::string& text) {
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool hasHelpFlag(const std::vector<std::string>& args, size_t start) {
    for (size_t i = start; i < args.size(); ++i) {
        if (args[i] == "-h" || args[i] == "--help") return true;
    }
    return false;
}

CliResult fail(CliResult result, const std::string& message) {
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\n" + getHelpMessage(result.lang);
    return result;
}

std::string getDownloadHelpMessage(Language lang) {
    std::ostringstream oss;
    oss << "sitemirror download - " << tr(lang, "ap_dl") << "\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    sitemirror download [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -w, --workers <N>     " << tr(lang, "ap_workers") << "\n";
    oss << "    -r, --retry <N>       " << tr(lang, "ap_retry") << "\n";
    oss << "    -h, --help            Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    SITEMIRROR_BASE_URL       Origin to mirror (default: https://homdgcat.wiki)\n";
    oss << "    SITEMIRROR_MANIFEST       File list path (default: filelist.txt)\n";
    oss << "    SITEMIRROR_SITE_DIR       Local mirror root (default: site)\n";
    oss << "    SITEMIRROR_TIMEOUT_MS     Per-attempt timeout (default: 30000)\n";
    oss << "    SITEMIRROR_BACKOFF_MS     Retry backoff unit (default: 1000)\n";
    return oss.str();
}

std::string getServeHelpMessage(Language lang) {
    std::ostringstream oss;
    oss << "sitemirror serve - " << tr(lang, "ap_serve") << "\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    sitemirror serve [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -p, --port <PORT>     " << tr(lang, "ap_port") << "\n";
    oss << "    --cert <FILE>         " << tr(lang, "ap_cert") << "\n";
    oss << "    --key <FILE>          " << tr(lang, "ap_key") << "\n";
    oss << "    -h, --help            Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    SITEMIRROR_PORT               HTTP server port (default: 9000)\n";
    oss << "    SITEMIRROR_SITE_DIR           Local mirror root (default: site)\n";
    oss << "    SITEMIRROR_LOG_LEVEL          Log level (trace|debug|info|warn|error)\n";
    oss << "    SITEMIRROR_LOG_DIR            Log directory (default: ~/.sitemirror/logs)\n";
    oss << "    SITEMIRROR_LOG_RETENTION_DAYS Log retention days (default: 7)\n";
    return oss.str();
}

std::string getStatusHelpMessage(Language lang) {
    std::ostringstream oss;
    oss << "sitemirror status - " << tr(lang, "ap_status") << "\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    sitemirror status\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help            Print help\n";
    return oss.str();
}

}  // namespace

std::string getHelpMessage(const std::string& lang_code) {
    const Language lang = cli::resolveLanguage(lang_code, "");
    std::ostringstream oss;
    oss << "sitemirror " << SITEMIRROR_VERSION << " - " << tr(lang, "ap_desc") << "\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    sitemirror [--lang zh|en] <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    download   " << tr(lang, "ap_dl") << "\n";
    oss << "    serve      " << tr(lang, "ap_serve") << "\n";
    oss << "    status     " << tr(lang, "ap_status") << "\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --lang <zh|en>   Override display language / 覆盖显示语言\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    SITEMIRROR_CONFIG         Config file path (default: ~/.sitemirror/config.json)\n";
    oss << "    SITEMIRROR_LANG           Display language (zh|en)\n";
    oss << "\n";
    oss << "Run 'sitemirror <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getVersionMessage() {
    return std::string("sitemirror ") + SITEMIRROR_VERSION + "\n";
}

std::string subcommandToString(Subcommand cmd) {
    switch (cmd) {
        case Subcommand::None: return "none";
        case Subcommand::Download: return "download";
        case Subcommand::Serve: return "serve";
        case Subcommand::Status: return "status";
    }
    return "unknown";
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // --lang may appear anywhere so that every help text follows it
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        std::string value;
        if (arg == "--lang") {
            if (i + 1 >= argc) return fail(result, "--lang requires a value (zh|en)");
            value = argv[++i];
        } else if (arg.rfind("--lang=", 0) == 0) {
            value = arg.substr(7);
        } else {
            args.push_back(arg);
            continue;
        }
        if (!cli::parseLanguage(value)) return fail(result, "invalid --lang '" + value + "' (choose zh or en)");
        result.lang = value;
    }

    // No arguments - caller prints usage
    if (args.empty()) {
        return result;
    }

    const std::string& command = args[0];
    const Language lang = cli::resolveLanguage(result.lang, "");

    if (command == "-h" || command == "--help") {
        result.should_exit = true;
        result.output = getHelpMessage(result.lang);
        return result;
    }

    if (command == "-V" || command == "--version") {
        result.should_exit = true;
        result.output = getVersionMessage();
        return result;
    }

    // Integer option value at args[i + 1] within [min, max]
    auto numberAfter = [&args](size_t& i, long min, long max) -> std::optional<long> {
        if (i + 1 >= args.size()) return std::nullopt;
        auto value = parseNumber(args[++i]);
        if (!value || *value < min || *value > max) return std::nullopt;
        return value;
    };

    if (command == "download") {
        result.subcommand = Subcommand::Download;
        if (hasHelpFlag(args, 1)) {
            result.should_exit = true;
            result.output = getDownloadHelpMessage(lang);
            return result;
        }
        for (size_t i = 1; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "-w" || arg == "--workers") {
                auto n = numberAfter(i, 1, 63);
                if (!n) return fail(result, arg + " expects an integer between 1 and 63");
                result.download_options.workers = static_cast<size_t>(*n);
            } else if (arg == "-r" || arg == "--retry") {
                auto n = numberAfter(i, 1, 100);
                if (!n) return fail(result, arg + " expects an integer between 1 and 100");
                result.download_options.retries = static_cast<int>(*n);
            } else {
                return fail(result, "unknown download option '" + arg + "'");
            }
        }
        return result;
    }

    if (command == "serve") {
        result.subcommand = Subcommand::Serve;
        if (hasHelpFlag(args, 1)) {
            result.should_exit = true;
            result.output = getServeHelpMessage(lang);
            return result;
        }
        for (size_t i = 1; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "-p" || arg == "--port") {
                auto n = numberAfter(i, 1, 65535);
                if (!n) return fail(result, arg + " expects a port between 1 and 65535");
                result.serve_options.port = static_cast<uint16_t>(*n);
            } else if (arg == "--cert" && i + 1 < args.size()) {
                result.serve_options.cert = args[++i];
            } else if (arg == "--key" && i + 1 < args.size()) {
                result.serve_options.key = args[++i];
            } else {
                return fail(result, "unknown or incomplete serve option '" + arg + "'");
            }
        }
        return result;
    }

    if (command == "status") {
        result.subcommand = Subcommand::Status;
        if (hasHelpFlag(args, 1)) {
            result.should_exit = true;
            result.output = getStatusHelpMessage(lang);
            return result;
        }
        if (args.size() > 1) return fail(result, "status takes no arguments");
        return result;
    }

    return fail(result, "unknown command '" + command + "'");
}

}  // namespace sitemirror
