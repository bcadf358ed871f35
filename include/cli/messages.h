#pragma once

#include <optional>
#include <string>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace sitemirror {
namespace cli {

enum class Language { Zh, En };

std::optional<Language> parseLanguage(const std::string& code);

const char* languageCode(Language lang);

/// Language from LC_ALL, LC_MESSAGES, LANG (first non-empty wins); "zh*" selects Chinese.
Language detectLanguage();

/// --lang beats the configured value, which beats locale detection.
Language resolveLanguage(const std::string& cli_lang, const std::string& config_lang);

/// fmt template for a message key, or the key itself when unknown.
std::string messageTemplate(Language lang, const std::string& key);

/// Localized message with named arguments, e.g. tr(lang, "dl_pending", fmt::arg("n", 3)).
template <typename... Args>
std::string tr(Language lang, const std::string& key, Args&&... args) {
    return fmt::format(fmt::runtime(messageTemplate(lang, key)), std::forward<Args>(args)...);
}

}  // namespace cli
}  // namespace sitemirror
