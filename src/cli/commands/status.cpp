#include "cli/commands.h"

#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

#include "mirror/manifest.h"
#include "mirror/mirror_status.h"

namespace sitemirror {
namespace cli {
namespace commands {

int status(const MirrorConfig& config, Language lang, std::ostream& out) {
    Manifest manifest;
    try {
        manifest = Manifest::load(config.manifest_path);
    } catch (const std::runtime_error& e) {
        spdlog::error("status: {}", e.what());
        out << tr(lang, "err_no_manifest", fmt::arg("path", config.manifest_path)) << "\n"
            << tr(lang, "err_manifest_hint") << std::endl;
        return 1;
    }

    const auto report = scanMirror(manifest, config.site_dir, 15);
    const std::string rule(55, '=');

    out << rule << "\n"
        << tr(lang, "st_title") << "\n"
        << rule << "\n"
        << tr(lang, "st_filelist", fmt::arg("n", report.total)) << "\n"
        << tr(lang, "st_downloaded", fmt::arg("n", report.present),
              fmt::arg("mb", report.present_bytes / 1024.0 / 1024.0)) << "\n"
        << tr(lang, "st_missing", fmt::arg("n", report.missing)) << "\n"
        << tr(lang, "st_progress", fmt::arg("pct", report.percentComplete())) << "\n";
    if (!report.missing_categories.empty()) {
        out << tr(lang, "st_missing_cats") << "\n";
        for (const auto& category : report.missing_categories) {
            out << "    " << category.first << ": " << category.second << "\n";
        }
    }
    out << rule << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace sitemirror
