#include <cratebox/crate.hpp>
#include <cratebox/file_lock.hpp>
#include <cratebox/log.hpp>
#include <cratebox/workspace.hpp>

namespace fs = std::filesystem;

namespace cratebox {

Crate Crate::registry(std::string name, std::string version) {
    return Crate(RegistryCrate(std::move(name), std::move(version)));
}

Crate Crate::git(std::string url) {
    return Crate(GitCrate(std::move(url)));
}

Crate Crate::local(fs::path path) {
    return Crate(LocalCrate(std::move(path)));
}

const CrateSource& Crate::source() const {
    return std::visit([](const auto& s) -> const CrateSource& { return s; }, source_);
}

Crate::Kind Crate::kind() const {
    switch (source_.index()) {
        case 0: return Kind::Registry;
        case 1: return Kind::Git;
        default: return Kind::Local;
    }
}

Status Crate::fetch(const Workspace& ws) const {
    const CrateSource& src = source();
    auto lock = src.cache_lock_path(ws);
    if (!lock) {
        return src.fetch(ws);
    }
    return with_file_lock(*lock, "fetch " + src.display(),
                          [&] { return src.fetch(ws); });
}

Status Crate::purge_from_cache(const Workspace& ws) const {
    const CrateSource& src = source();
    auto lock = src.cache_lock_path(ws);
    if (!lock) {
        return src.purge_from_cache(ws);
    }
    return with_file_lock(*lock, "purge " + src.display(),
                          [&] { return src.purge_from_cache(ws); });
}

std::optional<std::string> Crate::git_commit(const Workspace& ws) const {
    if (const auto* repo = std::get_if<GitCrate>(&source_)) {
        return repo->git_commit(ws);
    }
    return std::nullopt;
}

Status Crate::copy_source_to(const Workspace& ws, const fs::path& dest) const {
    std::error_code ec;
    bool dest_exists = fs::exists(dest, ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot inspect crate source directory: " + ec.message(),
            dest.string());
    }
    if (dest_exists) {
        log::info("crate source directory %s already exists, cleaning it up",
                  dest.c_str());
        fs::remove_all(dest, ec);
        if (ec) {
            return CrateboxError::at(CrateboxError::IO,
                "cannot clean up crate source directory: " + ec.message(),
                dest.string());
        }
    }

    auto copied = source().copy_source_to(ws, dest);
    if (copied.is_err()) {
        fs::remove_all(dest, ec);
        if (ec) {
            log::warn("failed to remove partial source tree %s: %s",
                      dest.c_str(), ec.message().c_str());
        }
        return copied;
    }
    return ok_status();
}

} // namespace cratebox
