#pragma once

#include <cratebox/result.hpp>
#include <filesystem>
#include <string>

namespace cratebox {

// Drop the first component of an archive entry path:
// "foo-1.0.0/src/lib.rs" -> "src/lib.rs", "foo-1.0.0/" -> "".
std::string strip_first_component(const std::string& entry_path);

// Extract a (possibly gzip-compressed) tar archive into `dest`, removing the
// first path component of every entry. Entries whose remaining path is empty
// (the wrapping directory itself) are skipped. Entries escaping `dest` via
// "..", and entries or hard-link targets reached through a symlink, are
// rejected as Archive errors.
// Does not clean up on failure; callers own `dest`.
Status unpack_without_first_dir(const std::filesystem::path& archive_path,
                                const std::filesystem::path& dest);

} // namespace cratebox
