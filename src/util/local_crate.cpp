#include <cratebox/local_crate.hpp>
#include <cratebox/log.hpp>
#include <cratebox/path.hpp>

#include <algorithm>
#include <vector>

namespace fs = std::filesystem;

namespace cratebox {

LocalCrate::LocalCrate(fs::path path) : path_(std::move(path)) {}

Status LocalCrate::fetch(const Workspace&) const {
    // Local crates have nothing to fetch
    return ok_status();
}

Status LocalCrate::purge_from_cache(const Workspace&) const {
    return ok_status();
}

std::optional<fs::path> LocalCrate::cache_lock_path(const Workspace&) const {
    return std::nullopt;
}

Status LocalCrate::copy_source_to(const Workspace&, const fs::path& dest) const {
    log::info("copying local crate from %s to %s", path_.c_str(), dest.c_str());
    return copy_dir(path_, dest);
}

std::string LocalCrate::display() const {
    return "local crate at " + path_.string();
}

// ---------------------------------------------------------------------------
// Directory walk
// ---------------------------------------------------------------------------

namespace {

struct CopyWalk {
    fs::path src_root;
    fs::path dest_root;
    // Directories currently being descended, used to spot symlink cycles
    std::vector<fs::path> ancestors;
};

// Status of `path` with symlinks followed. A link whose target cannot be
// resolved is reported against the link itself.
Result<fs::file_status> resolve(const fs::path& path) {
    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (!ec && fs::exists(st)) {
        return Result<fs::file_status>::ok(st);
    }

    std::error_code lec;
    if (fs::is_symlink(fs::symlink_status(path, lec))) {
        std::string why = ec ? ec.message() : "target does not exist";
        return CrateboxError::at(CrateboxError::Symlink,
            "cannot follow symlink " + path.string() + ": " + why,
            path.string());
    }
    return CrateboxError::at(CrateboxError::IO,
        "cannot read " + path.string() + ": " +
            (ec ? ec.message() : std::string("no such file")),
        path.string());
}

Status walk(CopyWalk& w, const fs::path& rel, int depth) {
    fs::path dir = rel.empty() ? w.src_root : w.src_root / rel;

    std::error_code ec;
    std::vector<fs::path> children;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path().filename());
    }
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot list directory " + dir.string() + ": " + ec.message(),
            dir.string());
    }
    std::sort(children.begin(), children.end());

    for (const auto& name : children) {
        fs::path child_rel = rel / name;
        fs::path child = w.src_root / child_rel;

        auto st = resolve(child);
        if (st.is_err()) return std::move(st).error();

        if (fs::is_directory(st.value())) {
            if (depth == 1 && name == "target") {
                log::info("ignoring top-level target directory %s", child_rel.c_str());
                continue;
            }

            for (const auto& ancestor : w.ancestors) {
                if (fs::equivalent(child, ancestor, ec)) {
                    return CrateboxError::at(CrateboxError::Symlink,
                        "symlink loop: " + child.string() + " leads back to " +
                            ancestor.string(),
                        child.string());
                }
            }

            fs::create_directories(w.dest_root / child_rel, ec);
            if (ec) {
                return CrateboxError::at(CrateboxError::IO,
                    "cannot create directory: " + ec.message(),
                    (w.dest_root / child_rel).string());
            }

            w.ancestors.push_back(child);
            CRATEBOX_TRY(walk(w, child_rel, depth + 1));
            w.ancestors.pop_back();
        } else {
            fs::copy_file(child, w.dest_root / child_rel,
                          fs::copy_options::overwrite_existing, ec);
            if (ec) {
                return CrateboxError::at(CrateboxError::IO,
                    "cannot copy " + child.string() + ": " + ec.message(),
                    child.string());
            }
        }
    }
    return ok_status();
}

} // namespace

Status copy_dir(const fs::path& src, const fs::path& dest) {
    CopyWalk w;
    w.src_root = normalize_path(src);
    w.dest_root = normalize_path(dest);

    auto st = resolve(w.src_root);
    if (st.is_err()) return std::move(st).error();
    if (!fs::is_directory(st.value())) {
        return CrateboxError::at(CrateboxError::NotFound,
            "local crate path is not a directory", w.src_root.string());
    }

    std::error_code ec;
    fs::create_directories(w.dest_root, ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot create directory: " + ec.message(), w.dest_root.string());
    }

    w.ancestors.push_back(w.src_root);
    return walk(w, fs::path(), 1);
}

} // namespace cratebox
