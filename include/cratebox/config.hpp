#pragma once

#include <cratebox/result.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace cratebox {

// Layered configuration: global (~/.cratebox/config.toml) then workspace
// (<root>/cratebox.toml). Only keys present in a file are set, so a later
// layer overrides an earlier one key by key.
struct Config {
    // [workspace]
    std::optional<std::string> cache_dir;
    std::optional<std::string> rustup_profile;
    std::optional<bool> fast_init;
    std::optional<std::string> user_agent;
    std::optional<int> command_timeout;

    // [registry]
    std::optional<std::string> crates_root;

    // [tools]
    std::optional<std::string> rustup_dist_root;
    std::optional<std::string> main_toolchain;

    // [log]
    std::optional<std::string> log_level;

    static Result<Config> load(const std::filesystem::path& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& workspace);
};

// ~/.cratebox/config.toml, or empty when no home directory is known
std::string global_config_path();

// Name of the per-workspace config file inside the workspace root
inline constexpr const char* kWorkspaceConfigName = "cratebox.toml";

} // namespace cratebox
