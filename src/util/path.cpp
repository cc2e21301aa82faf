#include <cratebox/path.hpp>
#include <cratebox/log.hpp>

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace fs = std::filesystem;

namespace cratebox {

std::optional<std::string> strip_verbatim_prefix(const std::string& path) {
    static const std::string verbatim = R"(\\?\)";
    if (path.compare(0, verbatim.size(), verbatim) != 0) {
        return std::nullopt;
    }
    std::string rest = path.substr(verbatim.size());

    // \\?\UNC\server\share\... keeps the double backslash of a UNC path
    static const std::string unc = R"(UNC\)";
    if (rest.size() >= unc.size() &&
        (rest.compare(0, unc.size(), unc) == 0 ||
         rest.compare(0, unc.size(), R"(unc\)") == 0)) {
        return R"(\\)" + rest.substr(unc.size());
    }

    // \\?\C:\... and \\?\C: both map to the drive form
    if (rest.size() >= 2 && std::isalpha(static_cast<unsigned char>(rest[0])) &&
        rest[1] == ':') {
        if (rest.size() == 2) rest += '\\';
        return rest;
    }

    return rest;
}

fs::path normalize_path(const fs::path& path) {
    std::error_code ec;
    fs::path p = fs::canonical(path, ec);
    if (ec) {
        p = path;
    }

#ifdef _WIN32
    if (auto stripped = strip_verbatim_prefix(p.string())) {
        p = fs::path(*stripped);
    }
    if (p.native().size() >= kMaxWindowsPathLen) {
        log::warn("canonicalized path is too long for Windows: %s",
                  p.string().c_str());
    }
#endif

    return p;
}

std::string escape_path_component(const std::string& raw) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    // "." and ".." are not usable as a directory name
    if (out == "." || out == "..") {
        std::string dotted;
        for (size_t i = 0; i < out.size(); ++i) dotted += "%2E";
        return dotted;
    }
    return out;
}

// FNV-1a, 64-bit
static uint64_t hash64(const std::string& data) {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

std::string cache_key_component(const std::string& raw) {
    std::string escaped = escape_path_component(raw);
    if (escaped.size() <= kMaxCacheKeyLen) return escaped;

    // Never cut through a %XX escape
    size_t cut = 64;
    if (escaped[cut - 1] == '%') cut -= 1;
    else if (escaped[cut - 2] == '%') cut -= 2;

    char suffix[18];
    std::snprintf(suffix, sizeof(suffix), "-%016llx",
                  static_cast<unsigned long long>(hash64(raw)));
    return escaped.substr(0, cut) + suffix;
}

} // namespace cratebox
