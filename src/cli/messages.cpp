#include "cli/messages.h"

#include <cstdlib>
#include <unordered_map>

namespace sitemirror {
namespace cli {

namespace {

struct Localized {
    std::string zh;
    std::string en;
};

const std::unordered_map<std::string, Localized>& messageTable() {
    static const std::unordered_map<std::string, Localized> table = {
        // manifest
        {"err_no_manifest", {"错误: 找不到文件列表 {path}", "Error: file list not found: {path}"}},
        {"err_manifest_hint", {"请确保 filelist.txt 位于当前目录，或通过 SITEMIRROR_MANIFEST 指定。",
                               "Make sure filelist.txt is in the current directory, or set SITEMIRROR_MANIFEST."}},
        // download
        {"dl_title", {"  HomDGCat Wiki 镜像下载", "  HomDGCat Wiki Mirror Download"}},
        {"dl_filelist", {"  文件列表: {n} 个", "  File list:  {n}"}},
        {"dl_existing", {"  已存在:   {n} 个", "  Existing:   {n}"}},
        {"dl_pending", {"  待下载:   {n} 个", "  Pending:    {n}"}},
        {"dl_workers", {"  并发数:   {n}", "  Workers:    {n}"}},
        {"dl_retries", {"  重试次数: {n}", "  Retries:    {n}"}},
        {"dl_nothing", {"\n所有文件已存在，无需下载。", "\nAll files already exist, nothing to download."}},
        {"dl_progress", {"  [{i}/{total}] 成功: {ok}  404: {nf}  失败: {fail}  速度: {speed:.0f} KB/s",
                         "  [{i}/{total}] OK: {ok}  404: {nf}  Failed: {fail}  Speed: {speed:.0f} KB/s"}},
        {"dl_done", {"  下载完成! 耗时 {sec:.0f} 秒", "  Done! Elapsed {sec:.0f}s"}},
        {"dl_new", {"  新增: {n} ({mb:.1f} MB)", "  New:    {n} ({mb:.1f} MB)"}},
        {"dl_404", {"  404:  {n}", "  404:    {n}"}},
        {"dl_failed", {"  失败: {n}", "  Failed: {n}"}},
        {"dl_fail_saved", {"  失败列表已保存到 {path}", "  Failure list saved to {path}"}},
        // serve
        {"srv_title", {"  HomDGCat Wiki 本地服务器", "  HomDGCat Wiki Local Server"}},
        {"srv_no_site", {"错误: {path} 目录不存在，请先运行 download 命令。",
                         "Error: {path} directory not found. Run the download command first."}},
        {"srv_no_tls", {"错误: HTTPS 需要带 OpenSSL 支持的构建。",
                        "Error: HTTPS requires a build with OpenSSL support."}},
        {"srv_engine", {"  引擎:   {e}", "  Engine:   {e}"}},
        {"srv_proto", {"  协议:   {p}", "  Protocol: {p}"}},
        {"srv_addr", {"  地址:   {url}", "  Address:  {url}"}},
        {"srv_stop", {"  按 Ctrl+C 停止", "  Press Ctrl+C to stop"}},
        {"srv_stopped", {"\n服务器已停止。", "\nServer stopped."}},
        {"srv_failed", {"错误: 服务器启动失败: {reason}", "Error: server failed to start: {reason}"}},
        // status
        {"st_title", {"  HomDGCat Wiki 镜像状态", "  HomDGCat Wiki Mirror Status"}},
        {"st_filelist", {"  文件列表: {n} 个", "  File list:   {n}"}},
        {"st_downloaded", {"  已下载:   {n} ({mb:.1f} MB)", "  Downloaded:  {n} ({mb:.1f} MB)"}},
        {"st_missing", {"  缺失:     {n}", "  Missing:     {n}"}},
        {"st_progress", {"  完成度:   {pct:.1f}%", "  Progress:    {pct:.1f}%"}},
        {"st_missing_cats", {"\n  缺失分类:", "\n  Missing by category:"}},
        // usage
        {"ap_desc", {"HomDGCat Wiki 完整镜像工具", "HomDGCat Wiki complete mirror tool"}},
        {"ap_dl", {"下载所有缺失文件", "Download all missing files"}},
        {"ap_workers", {"并发下载数 (默认 10)", "Concurrent downloads (default 10)"}},
        {"ap_retry", {"失败重试次数 (默认 3)", "Retry count (default 3)"}},
        {"ap_serve", {"启动本地 HTTP 服务器", "Start local HTTP server"}},
        {"ap_port", {"端口 (默认 9000)", "Port (default 9000)"}},
        {"ap_cert", {"TLS 证书路径 (启用 HTTPS)", "TLS certificate path (enables HTTPS)"}},
        {"ap_key", {"TLS 私钥路径", "TLS private key path"}},
        {"ap_status", {"查看下载进度", "Show download progress"}},
    };
    return table;
}

bool startsWith(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

}  // namespace

std::optional<Language> parseLanguage(const std::string& code) {
    if (code == "zh") return Language::Zh;
    if (code == "en") return Language::En;
    return std::nullopt;
}

const char* languageCode(Language lang) {
    return lang == Language::Zh ? "zh" : "en";
}

Language detectLanguage() {
    for (const char* name : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
        const char* value = std::getenv(name);
        if (!value || !*value) continue;
        const std::string locale(value);
        return startsWith(locale, "zh") || startsWith(locale, "Chinese") ? Language::Zh : Language::En;
    }
    return Language::En;
}

Language resolveLanguage(const std::string& cli_lang, const std::string& config_lang) {
    if (auto lang = parseLanguage(cli_lang)) return *lang;
    if (auto lang = parseLanguage(config_lang)) return *lang;
    return detectLanguage();
}

std::string messageTemplate(Language lang, const std::string& key) {
    const auto& table = messageTable();
    auto it = table.find(key);
    if (it == table.end()) {
        return key;
    }
    return lang == Language::Zh ? it->second.zh : it->second.en;
}

}  // namespace cli
}  // namespace sitemirror
