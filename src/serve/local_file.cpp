#include "serve/local_file.h"

#include <algorithm>
#include <cctype>
#include <sys/stat.h>

namespace sitemirror {

std::optional<LocalFile> statLocalFile(const std::filesystem::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return std::nullopt;
    }

    LocalFile file;
    file.path = path;
    file.size = static_cast<uint64_t>(st.st_size);
    file.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
                    static_cast<int64_t>(st.st_mtim.tv_nsec);
    file.extension = path.extension().string();
    std::transform(file.extension.begin(), file.extension.end(), file.extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return file;
}

}  // namespace sitemirror
