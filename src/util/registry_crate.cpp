#include <cratebox/registry_crate.hpp>
#include <cratebox/archive.hpp>
#include <cratebox/log.hpp>
#include <cratebox/workspace.hpp>

namespace fs = std::filesystem;

namespace cratebox {

RegistryCrate::RegistryCrate(std::string name, std::string version)
    : name_(std::move(name)), version_(std::move(version)) {}

fs::path RegistryCrate::cache_path(const Workspace& ws) const {
    return ws.cache_dir() / "cratesio-sources" / name_ /
           (name_ + "-" + version_ + ".crate");
}

std::string RegistryCrate::remote_url(const Workspace& ws) const {
    std::string root = ws.crates_root();
    while (!root.empty() && root.back() == '/') root.pop_back();
    return root + "/" + name_ + "/" + name_ + "-" + version_ + ".crate";
}

std::optional<fs::path> RegistryCrate::cache_lock_path(const Workspace& ws) const {
    return ws.lock_path("cratesio-" + name_ + "-" + version_);
}

Status RegistryCrate::fetch(const Workspace& ws) const {
    fs::path local = cache_path(ws);
    std::error_code ec;
    bool cached = fs::exists(local, ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot inspect cached crate: " + ec.message(), local.string());
    }
    if (cached) {
        log::info("crate %s %s is already in cache", name_.c_str(), version_.c_str());
        return ok_status();
    }

    log::info("fetching crate %s %s...", name_.c_str(), version_.c_str());
    fs::create_directories(local.parent_path(), ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot create cache directory: " + ec.message(),
            local.parent_path().string());
    }

    // Only a complete download is ever visible at the final path
    fs::path part = local;
    part += ".part";
    auto downloaded = ws.http().download(remote_url(ws), part);
    if (downloaded.is_err()) {
        fs::remove(part, ec);
        return std::move(downloaded).error().context(
            "unable to fetch crate " + name_ + " " + version_);
    }

    fs::rename(part, local, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(part, ignored);
        return CrateboxError::at(CrateboxError::IO,
            "cannot move downloaded crate into the cache: " + ec.message(),
            local.string());
    }
    return ok_status();
}

Status RegistryCrate::purge_from_cache(const Workspace& ws) const {
    fs::path path = cache_path(ws);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot remove cached crate: " + ec.message(), path.string());
    }
    return ok_status();
}

Status RegistryCrate::copy_source_to(const Workspace& ws, const fs::path& dest) const {
    fs::path cached = cache_path(ws);
    std::error_code ec;
    bool present = fs::exists(cached, ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot inspect cached crate: " + ec.message(), cached.string());
    }
    if (!present) {
        return CrateboxError{CrateboxError::NotFound,
            "crate " + name_ + " " + version_ + " is not in the cache",
            "fetch the crate before copying its source", cached.string()};
    }

    log::info("extracting crate %s %s into %s",
              name_.c_str(), version_.c_str(), dest.c_str());
    auto unpacked = unpack_without_first_dir(cached, dest);
    if (unpacked.is_err()) {
        fs::remove_all(dest, ec);
        return std::move(unpacked).error().context(
            "unable to unpack crate " + name_ + " version " + version_);
    }
    return ok_status();
}

std::string RegistryCrate::display() const {
    return "crate " + name_ + " " + version_ + " from registry";
}

} // namespace cratebox
