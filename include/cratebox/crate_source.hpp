#pragma once

#include <cratebox/result.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace cratebox {

class Workspace;

// Capability set shared by every crate backend
class CrateSource {
public:
    virtual ~CrateSource() = default;

    // Make a cached (or local) copy available. Repeated calls are no-ops
    // once the cache is satisfied.
    virtual Status fetch(const Workspace& ws) const = 0;

    // Remove the cached copy; succeeds when there is nothing to remove
    virtual Status purge_from_cache(const Workspace& ws) const = 0;

    // Materialize the source into `dest`, which must not exist yet
    virtual Status copy_source_to(const Workspace& ws,
                                  const std::filesystem::path& dest) const = 0;

    virtual std::string display() const = 0;

    // Lock serializing writers of this source's cache entry, or nullopt
    // when the source has no cache
    virtual std::optional<std::filesystem::path> cache_lock_path(
        const Workspace& ws) const = 0;
};

} // namespace cratebox
