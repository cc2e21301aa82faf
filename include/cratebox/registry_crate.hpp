#pragma once

#include <cratebox/crate_source.hpp>
#include <string>

namespace cratebox {

// A versioned package from the crates registry, cached as
// <cache>/cratesio-sources/<name>/<name>-<version>.crate
class RegistryCrate : public CrateSource {
public:
    RegistryCrate(std::string name, std::string version);

    Status fetch(const Workspace& ws) const override;
    Status purge_from_cache(const Workspace& ws) const override;
    Status copy_source_to(const Workspace& ws,
                          const std::filesystem::path& dest) const override;
    std::string display() const override;
    std::optional<std::filesystem::path> cache_lock_path(
        const Workspace& ws) const override;

    std::filesystem::path cache_path(const Workspace& ws) const;
    std::string remote_url(const Workspace& ws) const;

    const std::string& name() const { return name_; }
    const std::string& version() const { return version_; }

private:
    std::string name_;
    std::string version_;
};

} // namespace cratebox
