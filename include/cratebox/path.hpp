#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace cratebox {

// Conservative Windows path limit: MAX_PATH minus the 12 bytes directory
// creation reserves for an 8.3 file name.
constexpr std::size_t kMaxWindowsPathLen = 260 - 12;

// Canonicalize `path`, falling back to the input when it cannot be resolved
// (for example because it does not exist yet). On Windows the extended-length
// `\\?\` prefix produced by canonicalization is stripped, and a warning is
// logged when the result is still too long for directory creation.
std::filesystem::path normalize_path(const std::filesystem::path& path);

// If `path` starts with the extended-length prefix, return the conventional
// spelling:
//   \\?\C:\dir          -> C:\dir
//   \\?\UNC\srv\share\x -> \\srv\share\x
//   \\?\Volume{..}\x    -> Volume{..}\x
// Returns nullopt when there is no such prefix. Pure string operation.
std::optional<std::string> strip_verbatim_prefix(const std::string& path);

// Percent-encode everything outside [A-Za-z0-9._-] so an arbitrary string
// (typically a URL) can be used as a single path component.
std::string escape_path_component(const std::string& raw);

// escape_path_component, shortened for use as a cache or lock file name.
// Escaped names longer than kMaxCacheKeyLen keep a readable prefix followed
// by "-" and a 64-bit hash of `raw`, so distinct inputs stay distinct and
// the name fits in NAME_MAX.
constexpr std::size_t kMaxCacheKeyLen = 200;
std::string cache_key_component(const std::string& raw);

} // namespace cratebox
