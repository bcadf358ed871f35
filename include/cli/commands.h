#pragma once

#include <iostream>

#include "cli/messages.h"
#include "utils/cli.h"
#include "utils/config.h"

namespace sitemirror {
namespace cli {
namespace commands {

/// Execute the 'download' command
/// @return Exit code (0=success, 1=error)
int download(const MirrorConfig& config, const DownloadOptions& options, Language lang,
             std::ostream& out = std::cout);

/// Execute the 'serve' command; blocks until a shutdown is requested
/// @return Exit code (0=success, 1=error)
int serve(const MirrorConfig& config, const ServeOptions& options, Language lang,
          std::ostream& out = std::cout);

/// Execute the 'status' command
/// @return Exit code (0=success, 1=error)
int status(const MirrorConfig& config, Language lang, std::ostream& out = std::cout);

}  // namespace commands
}  // namespace cli
}  // namespace sitemirror
