#include <cratebox/native.hpp>

namespace fs = std::filesystem;

namespace cratebox {

Result<bool> is_executable(const fs::path& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return Result<bool>::ok(false);
        }
        return CrateboxError::at(CrateboxError::IO,
            "cannot stat " + path.string() + ": " + ec.message(), path.string());
    }
    if (!fs::is_regular_file(st)) {
        return Result<bool>::ok(false);
    }
#ifdef _WIN32
    return Result<bool>::ok(true);
#else
    auto perms = st.permissions();
    bool exec = (perms & (fs::perms::owner_exec | fs::perms::group_exec |
                          fs::perms::others_exec)) != fs::perms::none;
    return Result<bool>::ok(exec);
#endif
}

Status make_executable(const fs::path& path) {
    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_exec | fs::perms::group_exec |
                        fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot make " + path.string() + " executable: " + ec.message(),
            path.string());
    }
    return ok_status();
}

std::string host_target() {
#if defined(__x86_64__) || defined(_M_X64)
    const std::string arch = "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    const std::string arch = "aarch64";
#elif defined(__i386__) || defined(_M_IX86)
    const std::string arch = "i686";
#elif defined(__powerpc64__) && defined(__LITTLE_ENDIAN__)
    const std::string arch = "powerpc64le";
#elif defined(__riscv) && __riscv_xlen == 64
    const std::string arch = "riscv64gc";
#else
    const std::string arch = "unknown";
#endif

#if defined(_WIN32)
    return arch + "-pc-windows-msvc";
#elif defined(__APPLE__)
    return arch + "-apple-darwin";
#elif defined(__linux__) && defined(__musl__)
    return arch + "-unknown-linux-musl";
#elif defined(__linux__)
    return arch + "-unknown-linux-gnu";
#elif defined(__FreeBSD__)
    return arch + "-unknown-freebsd";
#else
    return arch + "-unknown-unknown";
#endif
}

} // namespace cratebox
