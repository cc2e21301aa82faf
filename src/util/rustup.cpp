#include <cratebox/rustup.hpp>
#include <cratebox/log.hpp>
#include <cratebox/native.hpp>
#include <cratebox/workspace.hpp>

#include <cerrno>
#include <cstring>

#include <stdlib.h>

namespace fs = std::filesystem;

namespace cratebox {

namespace {

// Scratch directory removed on scope exit
class ScratchDir {
public:
    static Result<ScratchDir> create(const std::string& prefix) {
        std::error_code ec;
        fs::path base = fs::temp_directory_path(ec);
        if (ec) base = "/tmp";
        std::string tmpl = (base / (prefix + "XXXXXX")).string();
        if (mkdtemp(tmpl.data()) == nullptr) {
            return CrateboxError::at(CrateboxError::IO,
                std::string("cannot create temporary directory: ") + strerror(errno),
                tmpl);
        }
        ScratchDir dir;
        dir.path_ = tmpl;
        return Result<ScratchDir>::ok(std::move(dir));
    }

    ScratchDir() = default;
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&& other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }
    ScratchDir& operator=(ScratchDir&&) = delete;

    ~ScratchDir() {
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

} // namespace

std::string RustupTool::installer_url(const Workspace& ws) {
    std::string root = ws.rustup_dist_root();
    while (!root.empty() && root.back() == '/') root.pop_back();
    return root + "/" + host_target() + "/rustup-init" + EXE_SUFFIX;
}

Status RustupTool::install(const Workspace& ws, bool) const {
    std::error_code ec;
    for (const auto& dir : {ws.cargo_home(), ws.rustup_home()}) {
        fs::create_directories(dir, ec);
        if (ec) {
            return CrateboxError::at(CrateboxError::IO,
                "cannot create directory: " + ec.message(), dir.string());
        }
    }

    auto scratch = ScratchDir::create("cratebox-rustup-");
    if (scratch.is_err()) return std::move(scratch).error();

    fs::path installer = scratch.value().path() / (std::string("rustup-init") + EXE_SUFFIX);
    CRATEBOX_TRY(ws.http().download(installer_url(ws), installer)
        .context("unable to download the rustup installer"));
    CRATEBOX_TRY(make_executable(installer));

    log::info("running the rustup installer");
    CRATEBOX_TRY(run_checked({installer.string(),
                              "-y",
                              "--no-modify-path",
                              "--default-toolchain", ws.main_toolchain(),
                              "--profile", ws.rustup_profile()},
                             managed_command_options(ws),
                             "unable to install rustup"));
    return ok_status();
}

Status RustupTool::update(const Workspace& ws, bool) const {
    std::string rustup = binary_path(ws).string();

    CRATEBOX_TRY(run_checked({rustup, "self", "update"},
                             managed_command_options(ws),
                             "failed to update rustup"));

    CRATEBOX_TRY(run_checked({rustup, "update", ws.main_toolchain()},
                             managed_command_options(ws),
                             "failed to update main toolchain " + ws.main_toolchain()));
    return ok_status();
}

} // namespace cratebox
