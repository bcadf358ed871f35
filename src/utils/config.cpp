#include "utils/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sitemirror {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::filesystem::path defaultConfigPath() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) return std::filesystem::path();
    return home / ".sitemirror/config.json";
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) return false;
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    try {
        ifs >> out;
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Config: ignoring unparsable file {}: {}", path.string(), e.what());
        return false;
    }
}

void applyJson(const nlohmann::json& j, MirrorConfig& cfg) {
    cfg.base_url = j.value("base_url", cfg.base_url);
    cfg.site_dir = j.value("site_dir", cfg.site_dir);
    cfg.manifest_path = j.value("manifest", cfg.manifest_path);
    cfg.failure_report_path = j.value("failure_report", cfg.failure_report_path);
    cfg.lang = j.value("lang", cfg.lang);
    cfg.bind_address = j.value("bind_address", cfg.bind_address);

    const auto workers = j.value("workers", static_cast<long long>(cfg.workers));
    if (workers > 0 && workers < 64) cfg.workers = static_cast<size_t>(workers);
    const auto retries = j.value("retries", cfg.retries);
    if (retries >= 1) cfg.retries = retries;
    const auto backoff = j.value("backoff_ms", static_cast<long long>(cfg.backoff_unit.count()));
    if (backoff >= 0) cfg.backoff_unit = std::chrono::milliseconds(backoff);
    const auto timeout = j.value("timeout_ms", static_cast<long long>(cfg.timeout.count()));
    if (timeout > 0) cfg.timeout = std::chrono::milliseconds(timeout);
    const auto chunk = j.value("chunk", static_cast<long long>(cfg.chunk_size));
    if (chunk > 0 && chunk <= (1 << 24)) cfg.chunk_size = static_cast<size_t>(chunk);
    const auto port = j.value("port", static_cast<long long>(cfg.port));
    if (port >= 0 && port <= 65535) cfg.port = static_cast<uint16_t>(port);
    const auto entries = j.value("cache_entries", static_cast<long long>(cfg.cache_entries));
    if (entries >= 0) cfg.cache_entries = static_cast<size_t>(entries);
}

// Parses an integer environment override; returns nullopt (and logs) when malformed.
std::optional<long long> envInteger(const char* name) {
    auto env = getEnvValue(name);
    if (!env) return std::nullopt;
    try {
        return std::stoll(*env);
    } catch (const std::exception&) {
        spdlog::warn("Config: ignoring non-numeric {}='{}'", name, *env);
        return std::nullopt;
    }
}

}  // namespace

MirrorConfig loadMirrorConfig() {
    return loadMirrorConfigWithLog().first;
}

std::pair<MirrorConfig, std::string> loadMirrorConfigWithLog() {
    MirrorConfig cfg;
    std::ostringstream log;
    bool used_file = false;
    bool used_env = false;

    std::filesystem::path config_path;
    if (auto env = getEnvValue("SITEMIRROR_CONFIG")) {
        config_path = *env;
    } else {
        config_path = defaultConfigPath();
    }

    nlohmann::json j;
    if (readJson(config_path, j) && j.is_object()) {
        try {
            applyJson(j, cfg);
            used_file = true;
            log << "file=" << config_path.string() << " ";
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Config: invalid value in {}: {}", config_path.string(), e.what());
        }
    }

    auto string_override = [&](const char* name, std::string& field, const char* label) {
        if (auto env = getEnvValue(name)) {
            field = *env;
            log << "env:" << label << "=" << *env << " ";
            used_env = true;
        }
    };
    string_override("SITEMIRROR_BASE_URL", cfg.base_url, "BASE_URL");
    string_override("SITEMIRROR_SITE_DIR", cfg.site_dir, "SITE_DIR");
    string_override("SITEMIRROR_MANIFEST", cfg.manifest_path, "MANIFEST");
    string_override("SITEMIRROR_LANG", cfg.lang, "LANG");

    if (auto v = envInteger("SITEMIRROR_WORKERS")) {
        if (*v > 0 && *v < 64) cfg.workers = static_cast<size_t>(*v);
        log << "env:WORKERS=" << *v << " ";
        used_env = true;
    }
    if (auto v = envInteger("SITEMIRROR_RETRIES")) {
        if (*v >= 1) cfg.retries = static_cast<int>(*v);
        log << "env:RETRIES=" << *v << " ";
        used_env = true;
    }
    if (auto v = envInteger("SITEMIRROR_BACKOFF_MS")) {
        if (*v >= 0) cfg.backoff_unit = std::chrono::milliseconds(*v);
        log << "env:BACKOFF_MS=" << *v << " ";
        used_env = true;
    }
    if (auto v = envInteger("SITEMIRROR_TIMEOUT_MS")) {
        if (*v > 0) cfg.timeout = std::chrono::milliseconds(*v);
        log << "env:TIMEOUT_MS=" << *v << " ";
        used_env = true;
    }
    if (auto v = envInteger("SITEMIRROR_PORT")) {
        if (*v >= 0 && *v <= 65535) cfg.port = static_cast<uint16_t>(*v);
        log << "env:PORT=" << *v << " ";
        used_env = true;
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

}  // namespace sitemirror
