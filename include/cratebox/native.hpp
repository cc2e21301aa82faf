#pragma once

#include <cratebox/result.hpp>
#include <filesystem>
#include <string>

namespace cratebox {

#ifdef _WIN32
inline constexpr const char* EXE_SUFFIX = ".exe";
#else
inline constexpr const char* EXE_SUFFIX = "";
#endif

// Regular file with at least one execute bit set
Result<bool> is_executable(const std::filesystem::path& path);

// Add u+x, g+x, o+x to the file's permissions
Status make_executable(const std::filesystem::path& path);

// Target triple of the machine this binary was built for,
// e.g. "x86_64-unknown-linux-gnu"
std::string host_target();

} // namespace cratebox
