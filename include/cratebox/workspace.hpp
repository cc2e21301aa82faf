#pragma once

#include <cratebox/result.hpp>
#include <cratebox/config.hpp>
#include <cratebox/http.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace cratebox {

class ToolRegistry;

inline constexpr const char* kDefaultCratesRoot = "https://static.crates.io/crates";
inline constexpr const char* kDefaultRustupDistRoot = "https://static.rust-lang.org/rustup/dist";
inline constexpr const char* kDefaultMainToolchain = "stable";

struct WorkspaceOptions {
    std::filesystem::path cache_dir;     // empty: <root>/cache
    std::string rustup_profile = "minimal";
    bool fast_init = false;
    std::string user_agent = "cratebox/0.1";
    int command_timeout = 0;             // seconds, 0 disables it
    std::string crates_root = kDefaultCratesRoot;
    std::string rustup_dist_root = kDefaultRustupDistRoot;
    std::string main_toolchain = kDefaultMainToolchain;
    std::shared_ptr<HttpClient> http;    // null: libcurl client

    // Defaults overridden by every key the config sets
    static WorkspaceOptions from_config(const Config& cfg);
};

// Shared directories and capabilities every crate source and tool works
// against. Cheap to copy; copies share the HTTP client.
class Workspace {
public:
    // Create the directory layout under `root` and build the workspace
    static Result<Workspace> open(const std::filesystem::path& root,
                                  WorkspaceOptions options = {});

    // Like open(), with options read from the global config and
    // <root>/cratebox.toml (both optional). Applies [log] level.
    static Result<Workspace> open_with_config(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& cache_dir() const { return cache_dir_; }
    std::filesystem::path cargo_home() const { return root_ / "cargo-home"; }
    std::filesystem::path rustup_home() const { return root_ / "rustup-home"; }

    // Lock file guarding the shared resource `name`
    std::filesystem::path lock_path(const std::string& name) const;

    const std::string& rustup_profile() const { return options_.rustup_profile; }
    const std::string& main_toolchain() const { return options_.main_toolchain; }
    const std::string& crates_root() const { return options_.crates_root; }
    const std::string& rustup_dist_root() const { return options_.rustup_dist_root; }
    int command_timeout() const { return options_.command_timeout; }
    bool fast_init() const { return options_.fast_init; }

    HttpClient& http() const { return *options_.http; }

    // Remove every cached crate and git repository
    Status purge_all_caches() const;

    // Install or update every tool of `registry`
    Status install_tools(const ToolRegistry& registry) const;

private:
    std::filesystem::path root_;
    std::filesystem::path cache_dir_;
    WorkspaceOptions options_;
};

} // namespace cratebox
