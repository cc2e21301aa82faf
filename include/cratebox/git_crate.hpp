#pragma once

#include <cratebox/crate_source.hpp>
#include <cratebox/process.hpp>
#include <string>
#include <vector>

namespace cratebox {

// A crate living in a git repository. The cache is a bare clone under
// <cache>/git-repos/<escaped url>; "current" is whatever the last fetch saw.
class GitCrate : public CrateSource {
public:
    explicit GitCrate(std::string url);

    Status fetch(const Workspace& ws) const override;
    Status purge_from_cache(const Workspace& ws) const override;
    Status copy_source_to(const Workspace& ws,
                          const std::filesystem::path& dest) const override;
    std::string display() const override;
    std::optional<std::filesystem::path> cache_lock_path(
        const Workspace& ws) const override;

    // HEAD of the cached clone; nullopt when it cannot be read
    std::optional<std::string> git_commit(const Workspace& ws) const;

    std::filesystem::path cached_path(const Workspace& ws) const;
    const std::string& url() const { return url_; }

private:
    // "git" plus the config that keeps git from ever prompting for a password
    std::vector<std::string> git_command(const Workspace& ws) const;
    CommandOptions command_options(const Workspace& ws) const;

    std::string url_;
};

} // namespace cratebox
