#include <cratebox/config.hpp>
#include <cratebox/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace cratebox {

namespace {

void read_string(const toml::table& tbl, const char* key,
                 std::optional<std::string>& into) {
    if (auto v = tbl[key].value<std::string>()) into = std::string(*v);
}

void warn_unknown_keys(const toml::table& tbl, const std::string& section,
                       std::initializer_list<const char*> keys) {
    for (const auto& [key, val] : tbl) {
        bool known = false;
        for (const char* k : keys) {
            if (key.str() == k) { known = true; break; }
        }
        if (!known) {
            log::warn("ignoring unknown config key '%s.%s'",
                      section.c_str(), std::string(key.str()).c_str());
        }
    }
}

} // namespace

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return CrateboxError{CrateboxError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    if (auto ws = doc["workspace"].as_table()) {
        warn_unknown_keys(*ws, "workspace",
            {"cache-dir", "rustup-profile", "fast-init", "user-agent", "command-timeout"});
        read_string(*ws, "cache-dir", cfg.cache_dir);
        read_string(*ws, "rustup-profile", cfg.rustup_profile);
        read_string(*ws, "user-agent", cfg.user_agent);
        if (auto v = (*ws)["fast-init"].value<bool>()) {
            cfg.fast_init = *v;
        }
        if (auto v = (*ws)["command-timeout"].value<int64_t>()) {
            if (*v < 0) {
                return CrateboxError{CrateboxError::Config,
                    "workspace.command-timeout must not be negative",
                    "use 0 to disable the timeout"};
            }
            cfg.command_timeout = static_cast<int>(*v);
        }
    }

    if (auto reg = doc["registry"].as_table()) {
        warn_unknown_keys(*reg, "registry", {"crates-root"});
        read_string(*reg, "crates-root", cfg.crates_root);
    }

    if (auto tools = doc["tools"].as_table()) {
        warn_unknown_keys(*tools, "tools",
            {"rustup-dist-root", "main-toolchain"});
        read_string(*tools, "rustup-dist-root", cfg.rustup_dist_root);
        read_string(*tools, "main-toolchain", cfg.main_toolchain);
    }

    if (auto lg = doc["log"].as_table()) {
        warn_unknown_keys(*lg, "log", {"level"});
        read_string(*lg, "level", cfg.log_level);
        if (cfg.log_level) {
            log::Level lvl;
            if (!log::parse_level(*cfg.log_level, lvl)) {
                return CrateboxError{CrateboxError::Config,
                    "unknown log level '" + *cfg.log_level + "'",
                    "use one of: trace, debug, info, warn, error"};
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot open config file", path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.path = path.string();
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.cache_dir) cache_dir = other.cache_dir;
    if (other.rustup_profile) rustup_profile = other.rustup_profile;
    if (other.fast_init) fast_init = other.fast_init;
    if (other.user_agent) user_agent = other.user_agent;
    if (other.command_timeout) command_timeout = other.command_timeout;
    if (other.crates_root) crates_root = other.crates_root;
    if (other.rustup_dist_root) rustup_dist_root = other.rustup_dist_root;
    if (other.main_toolchain) main_toolchain = other.main_toolchain;
    if (other.log_level) log_level = other.log_level;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& workspace) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (workspace.has_value()) result.merge(workspace.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.cratebox/config.toml";
}

} // namespace cratebox
