#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace sitemirror::logger {

namespace {
constexpr const char* kFilePrefix = "sitemirror.jsonl.";
constexpr const char* kConsolePattern = "[%Y-%m-%d %T.%e] [%l] %v";
constexpr const char* kJsonPattern = R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})";

std::string local_date(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_value{};
    localtime_r(&t, &tm_value);
    std::ostringstream oss;
    oss << std::put_time(&tm_value, "%Y-%m-%d");
    return oss.str();
}
}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

LogSettings settings_from_env() {
    LogSettings settings;
    if (const char* level = std::getenv("SITEMIRROR_LOG_LEVEL")) {
        settings.level = parse_level(level);
    }
    if (const char* dir = std::getenv("SITEMIRROR_LOG_DIR")) {
        settings.dir = dir;
    } else {
        const char* home = std::getenv("HOME");
        settings.dir = fs::path(home ? home : "/tmp") / ".sitemirror" / "logs";
    }
    if (const char* days = std::getenv("SITEMIRROR_LOG_RETENTION_DAYS")) {
        try {
            const int value = std::stoi(days);
            if (value > 0 && value < 365) settings.retention_days = value;
        } catch (const std::exception&) {
            // keep the default
        }
    }
    return settings;
}

fs::path log_file_for(const fs::path& dir, std::chrono::system_clock::time_point day) {
    return dir / (kFilePrefix + local_date(day));
}

size_t remove_expired_logs(const fs::path& dir, int retention_days) {
    std::error_code ec;
    const auto cutoff = local_date(std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days));
    const std::string prefix = kFilePrefix;
    size_t removed = 0;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const auto name = entry.path().filename().string();
        // ISO dates compare correctly as strings
        if (name.rfind(prefix, 0) != 0 || name.substr(prefix.size()) >= cutoff) continue;
        std::error_code remove_ec;
        if (fs::remove(entry.path(), remove_ec)) ++removed;
    }
    return removed;
}

void install(spdlog::level::level_enum level, std::vector<spdlog::sink_ptr> sinks) {
    auto logger = std::make_shared<spdlog::logger>("sitemirror", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::info);
}

void init(const LogSettings& settings) {
    // stdout carries download progress, so the console only gets warnings
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(kConsolePattern);
    console->set_level(spdlog::level::warn);
    std::vector<spdlog::sink_ptr> sinks{console};

    const auto path = log_file_for(settings.dir, std::chrono::system_clock::now());
    std::string file_error;
    std::error_code ec;
    fs::create_directories(settings.dir, ec);
    if (ec) {
        file_error = ec.message();
    } else {
        remove_expired_logs(settings.dir, settings.retention_days);
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
            file->set_pattern(kJsonPattern);
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    install(settings.level, std::move(sinks));
    if (file_error.empty()) {
        spdlog::info("Logs initialized: {}", path.string());
    } else {
        spdlog::warn("File logging disabled: dir={} {}", settings.dir.string(), file_error);
    }
}

void init_from_env() { init(settings_from_env()); }

}  // namespace sitemirror::logger
