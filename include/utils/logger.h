// logger.h - process logging for sitemirror: stderr for warnings, daily JSONL file for the rest
#pragma once

#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sitemirror::logger {

struct LogSettings {
    spdlog::level::level_enum level{spdlog::level::info};
    std::filesystem::path dir;  // ~/.sitemirror/logs
    int retention_days{7};
};

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// SITEMIRROR_LOG_DIR, SITEMIRROR_LOG_LEVEL and SITEMIRROR_LOG_RETENTION_DAYS (1..364).
LogSettings settings_from_env();

// <dir>/sitemirror.jsonl.YYYY-MM-DD for the local date of day.
std::filesystem::path log_file_for(const std::filesystem::path& dir,
                                   std::chrono::system_clock::time_point day);

// Delete sitemirror.jsonl.* files dated before today minus retention_days. Returns the count removed.
size_t remove_expired_logs(const std::filesystem::path& dir, int retention_days);

// Replace the default logger with one named "sitemirror" writing to sinks.
void install(spdlog::level::level_enum level, std::vector<spdlog::sink_ptr> sinks);

// Install the console and file sinks described by settings. A file sink that cannot
// be opened is reported on the console and skipped.
void init(const LogSettings& settings);

void init_from_env();

}  // namespace sitemirror::logger
