#include <cratebox/git_crate.hpp>
#include <cratebox/binary_crate.hpp>
#include <cratebox/log.hpp>
#include <cratebox/path.hpp>
#include <cratebox/workspace.hpp>

namespace fs = std::filesystem;

namespace cratebox {

GitCrate::GitCrate(std::string url) : url_(std::move(url)) {}

fs::path GitCrate::cached_path(const Workspace& ws) const {
    return ws.cache_dir() / "git-repos" / cache_key_component(url_);
}

std::optional<fs::path> GitCrate::cache_lock_path(const Workspace& ws) const {
    return ws.lock_path("git-" + url_);
}

std::vector<std::string> GitCrate::git_command(const Workspace& ws) const {
    fs::path helper = BinaryCrateTool::git_credential_null().binary_path(ws);
    return {"git", "-c", "credential.helper=" + helper.string()};
}

CommandOptions GitCrate::command_options(const Workspace& ws) const {
    CommandOptions opts;
    opts.timeout_seconds = ws.command_timeout();
    opts.env.emplace_back("GIT_TERMINAL_PROMPT", "0");
    return opts;
}

Status GitCrate::fetch(const Workspace& ws) const {
    fs::path path = cached_path(ws);
    std::error_code ec;
    auto args = git_command(ws);

    bool cached = fs::is_regular_file(path / "HEAD", ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot inspect cached repository: " + ec.message(), path.string());
    }
    if (cached) {
        log::info("updating cached repository %s", url_.c_str());
        args.insert(args.end(), {"-C", path.string(), "fetch", "--prune", "origin",
                                 "+refs/heads/*:refs/heads/*",
                                 "+refs/tags/*:refs/tags/*"});
        auto r = run_checked(args, command_options(ws),
                             "failed to update git repository " + url_);
        if (r.is_err()) {
            auto err = std::move(r).error();
            err.code = CrateboxError::Git;
            return err;
        }
        return ok_status();
    }

    log::info("cloning repository %s", url_.c_str());
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot create cache directory: " + ec.message(),
            path.parent_path().string());
    }
    // A half-written clone would pass for a complete one next time
    fs::remove_all(path, ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot remove incomplete cached repository: " + ec.message(),
            path.string());
    }

    args.insert(args.end(), {"clone", "--bare", url_, path.string()});
    auto r = run_checked(args, command_options(ws),
                         "failed to clone git repository " + url_);
    if (r.is_err()) {
        fs::remove_all(path, ec);
        auto err = std::move(r).error();
        err.code = CrateboxError::Git;
        return err;
    }
    return ok_status();
}

Status GitCrate::purge_from_cache(const Workspace& ws) const {
    fs::path path = cached_path(ws);
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot remove cached repository: " + ec.message(), path.string());
    }
    return ok_status();
}

Status GitCrate::copy_source_to(const Workspace& ws, const fs::path& dest) const {
    fs::path path = cached_path(ws);
    std::error_code ec;
    bool cached = fs::is_regular_file(path / "HEAD", ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot inspect cached repository: " + ec.message(), path.string());
    }
    if (!cached) {
        return CrateboxError{CrateboxError::NotFound,
            "git repository " + url_ + " is not in the cache",
            "fetch the crate before copying its source", path.string()};
    }

    log::info("cloning %s into %s", url_.c_str(), dest.c_str());
    auto args = git_command(ws);
    args.insert(args.end(), {"clone", path.string(), dest.string()});
    auto r = run_checked(args, command_options(ws),
                         "failed to checkout git repository " + url_);
    if (r.is_err()) {
        auto err = std::move(r).error();
        err.code = CrateboxError::Git;
        return err;
    }
    return ok_status();
}

std::optional<std::string> GitCrate::git_commit(const Workspace& ws) const {
    auto args = git_command(ws);
    args.insert(args.end(), {"-C", cached_path(ws).string(), "rev-parse", "HEAD"});
    auto r = run_command(args, command_options(ws));
    if (r.is_err()) {
        log::debug("cannot read commit of %s: %s", url_.c_str(),
                   r.error().message.c_str());
        return std::nullopt;
    }
    if (r.value().exit_code != 0) {
        log::debug("cannot read commit of %s: %s", url_.c_str(),
                   r.value().stderr_str.c_str());
        return std::nullopt;
    }

    std::string sha = trim_trailing_newlines(r.value().stdout_str);
    if (sha.empty()) return std::nullopt;
    return sha;
}

std::string GitCrate::display() const {
    return "git crate at " + url_;
}

} // namespace cratebox
