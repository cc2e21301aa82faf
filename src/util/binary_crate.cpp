#include <cratebox/binary_crate.hpp>
#include <cratebox/log.hpp>
#include <cratebox/native.hpp>
#include <cratebox/workspace.hpp>

namespace cratebox {

BinaryCrateTool::BinaryCrateTool(std::string crate_name, std::string binary,
                                 std::optional<std::string> cargo_subcommand)
    : crate_name_(std::move(crate_name)),
      binary_(std::move(binary)),
      cargo_subcommand_(std::move(cargo_subcommand)) {}

BinaryCrateTool BinaryCrateTool::rustup_toolchain_install_master() {
    return BinaryCrateTool("rustup-toolchain-install-master",
                           "rustup-toolchain-install-master");
}

BinaryCrateTool BinaryCrateTool::git_credential_null() {
    return BinaryCrateTool("git-credential-null", "git-credential-null");
}

std::string BinaryCrateTool::name() const {
    if (cargo_subcommand_) {
        return "cargo-" + *cargo_subcommand_;
    }
    return binary_;
}

Status BinaryCrateTool::install(const Workspace& ws, bool fast_install) const {
    std::string cargo = (ws.cargo_home() / "bin" / (std::string("cargo") + EXE_SUFFIX)).string();
    std::vector<std::string> args = {cargo, "install", crate_name_};
    if (fast_install) {
        args.push_back("--debug");
    }

    log::info("installing %s with cargo", crate_name_.c_str());
    auto opts = managed_command_options(ws);
    // Compiling a crate routinely outlives a short command timeout
    opts.timeout_seconds = 0;
    CRATEBOX_TRY(run_checked(args, opts, "unable to install crate " + crate_name_));
    return ok_status();
}

Status BinaryCrateTool::update(const Workspace& ws, bool fast_install) const {
    return install(ws, fast_install);
}

} // namespace cratebox
