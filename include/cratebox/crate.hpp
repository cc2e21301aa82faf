#pragma once

#include <cratebox/git_crate.hpp>
#include <cratebox/local_crate.hpp>
#include <cratebox/registry_crate.hpp>
#include <cratebox/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace cratebox {

class Workspace;

// A crate that can be prepared for building. Immutable once constructed;
// every operation acts on the workspace cache or a destination directory.
class Crate {
public:
    enum class Kind { Registry, Git, Local };

    // A crate from the crates.io registry
    static Crate registry(std::string name, std::string version);

    // A crate from a git repository; `url` must be cloneable as given
    static Crate git(std::string url);

    // A crate in a directory of the local filesystem
    static Crate local(std::filesystem::path path);

    // Fetch the source into the workspace cache, under the cache entry's
    // lock. May reach out to the network.
    Status fetch(const Workspace& ws) const;

    // Remove the cached copy; does nothing when the crate is not cached
    Status purge_from_cache(const Workspace& ws) const;

    // Best effort: the commit of a git crate's cached clone, nullopt for
    // every other kind or when it cannot be read.
    std::optional<std::string> git_commit(const Workspace& ws) const;

    // Replace `dest` with the crate's source. An existing `dest` is removed
    // first; on failure `dest` is removed again so no partial tree remains.
    Status copy_source_to(const Workspace& ws, const std::filesystem::path& dest) const;

    Kind kind() const;
    const CrateSource& source() const;
    std::string to_string() const { return source().display(); }

private:
    using Source = std::variant<RegistryCrate, GitCrate, LocalCrate>;

    explicit Crate(Source source) : source_(std::move(source)) {}

    Source source_;
};

} // namespace cratebox
