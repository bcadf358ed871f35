#include "utils/gzip.h"

#include <zlib.h>

namespace sitemirror {

namespace {
// windowBits 15 + 16 selects the gzip wrapper instead of raw zlib.
constexpr int kGzipWindowBits = 15 + 16;
constexpr size_t kBufferSize = 32768;
}  // namespace

std::optional<std::string> gzipCompress(const std::string& input, int level) {
    z_stream zs{};
    if (deflateInit2(&zs, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string output;
    output.reserve(input.size() / 2 + 64);
    char buffer[kBufferSize];

    int ret = Z_OK;
    while (ret == Z_OK) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = static_cast<uInt>(sizeof(buffer));
        ret = deflate(&zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return std::nullopt;
        }
        const size_t written = sizeof(buffer) - zs.avail_out;
        if (written > 0) {
            output.append(buffer, written);
        }
    }

    deflateEnd(&zs);
    return output;
}

std::optional<std::string> gzipDecompress(const std::string& input) {
    z_stream zs{};
    if (inflateInit2(&zs, kGzipWindowBits) != Z_OK) {
        return std::nullopt;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string output;
    char buffer[kBufferSize];

    int ret = Z_OK;
    while (ret == Z_OK) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = static_cast<uInt>(sizeof(buffer));
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return std::nullopt;
        }
        output.append(buffer, sizeof(buffer) - zs.avail_out);
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            // truncated stream
            inflateEnd(&zs);
            return std::nullopt;
        }
    }

    inflateEnd(&zs);
    return output;
}

}  // namespace sitemirror
