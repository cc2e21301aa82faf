#pragma once

#include <cratebox/crate_source.hpp>

namespace cratebox {

// A crate in a directory on this machine. Nothing is cached; copying walks
// the directory, following symlinks, and leaves out the top-level `target`
// build directory.
class LocalCrate : public CrateSource {
public:
    explicit LocalCrate(std::filesystem::path path);

    Status fetch(const Workspace& ws) const override;
    Status purge_from_cache(const Workspace& ws) const override;
    Status copy_source_to(const Workspace& ws,
                          const std::filesystem::path& dest) const override;
    std::string display() const override;
    std::optional<std::filesystem::path> cache_lock_path(
        const Workspace& ws) const override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Recursively copy `src` into `dest`, following symlinks. A directory named
// "target" directly below `src` is skipped. Broken symlinks and symlinks
// leading back into their own ancestry fail with a Symlink error carrying
// the offending path.
Status copy_dir(const std::filesystem::path& src, const std::filesystem::path& dest);

} // namespace cratebox
