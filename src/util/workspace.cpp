#include <cratebox/workspace.hpp>
#include <cratebox/log.hpp>
#include <cratebox/path.hpp>
#include <cratebox/tools.hpp>

namespace cratebox {

namespace fs = std::filesystem;

WorkspaceOptions WorkspaceOptions::from_config(const Config& cfg) {
    WorkspaceOptions opts;
    if (cfg.cache_dir) opts.cache_dir = *cfg.cache_dir;
    if (cfg.rustup_profile) opts.rustup_profile = *cfg.rustup_profile;
    if (cfg.fast_init) opts.fast_init = *cfg.fast_init;
    if (cfg.user_agent) opts.user_agent = *cfg.user_agent;
    if (cfg.command_timeout) opts.command_timeout = *cfg.command_timeout;
    if (cfg.crates_root) opts.crates_root = *cfg.crates_root;
    if (cfg.rustup_dist_root) opts.rustup_dist_root = *cfg.rustup_dist_root;
    if (cfg.main_toolchain) opts.main_toolchain = *cfg.main_toolchain;
    return opts;
}

static Status create_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return CrateboxError::at(CrateboxError::IO,
            "cannot create workspace directory: " + ec.message(), dir.string());
    }
    return ok_status();
}

Result<Workspace> Workspace::open(const fs::path& root, WorkspaceOptions options) {
    CRATEBOX_TRY(create_dir(root));

    Workspace ws;
    ws.root_ = normalize_path(root);

    if (options.cache_dir.empty()) {
        ws.cache_dir_ = ws.root_ / "cache";
    } else if (options.cache_dir.is_relative()) {
        ws.cache_dir_ = ws.root_ / options.cache_dir;
    } else {
        ws.cache_dir_ = options.cache_dir;
    }

    if (!options.http) {
        options.http = make_default_http_client(options.user_agent);
    }
    ws.options_ = std::move(options);

    CRATEBOX_TRY(create_dir(ws.cache_dir_));
    CRATEBOX_TRY(create_dir(ws.cargo_home()));
    CRATEBOX_TRY(create_dir(ws.rustup_home()));
    CRATEBOX_TRY(create_dir(ws.root_ / "locks"));

    log::debug("opened workspace at %s", ws.root_.c_str());
    return Result<Workspace>::ok(std::move(ws));
}

Result<Workspace> Workspace::open_with_config(const fs::path& root) {
    std::error_code ec;
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto cfg = Config::load(global_path);
        if (cfg.is_err()) return std::move(cfg).error();
        global = std::move(cfg).value();
    }

    std::optional<Config> local;
    fs::path local_path = root / kWorkspaceConfigName;
    if (fs::exists(local_path, ec)) {
        auto cfg = Config::load(local_path);
        if (cfg.is_err()) return std::move(cfg).error();
        local = std::move(cfg).value();
    }

    Config effective = Config::effective(global, local);
    if (effective.log_level) {
        log::Level lvl;
        if (log::parse_level(*effective.log_level, lvl)) log::set_level(lvl);
    }

    return open(root, WorkspaceOptions::from_config(effective));
}

fs::path Workspace::lock_path(const std::string& name) const {
    return root_ / "locks" / (cache_key_component(name) + ".lock");
}

Status Workspace::purge_all_caches() const {
    log::info("purging all caches in %s", cache_dir_.c_str());
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(cache_dir_, ec)) {
        fs::remove_all(entry.path(), ec);
        if (ec) {
            return CrateboxError::at(CrateboxError::IO,
                "failed to purge cache: " + ec.message(), entry.path().string());
        }
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return CrateboxError::at(CrateboxError::IO,
            "failed to list cache: " + ec.message(), cache_dir_.string());
    }
    return ok_status();
}

Status Workspace::install_tools(const ToolRegistry& registry) const {
    return registry.install(*this, options_.fast_init);
}

} // namespace cratebox
