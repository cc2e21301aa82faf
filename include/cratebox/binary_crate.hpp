#pragma once

#include <cratebox/tools.hpp>
#include <optional>
#include <string>

namespace cratebox {

// A tool distributed as a crate and installed with `cargo install`.
// Requires the toolchain manager to be installed first.
class BinaryCrateTool : public Tool {
public:
    BinaryCrateTool(std::string crate_name, std::string binary,
                    std::optional<std::string> cargo_subcommand = std::nullopt);

    static BinaryCrateTool rustup_toolchain_install_master();
    static BinaryCrateTool git_credential_null();

    // The binary name, or cargo-<subcommand> for cargo subcommands
    std::string name() const override;

    // `cargo install <crate>`, with --debug when fast_install is set
    Status install(const Workspace& ws, bool fast_install) const override;

    // Re-runs the install, which upgrades an outdated binary
    Status update(const Workspace& ws, bool fast_install) const override;

    const std::string& crate_name() const { return crate_name_; }

private:
    std::string crate_name_;
    std::string binary_;
    std::optional<std::string> cargo_subcommand_;
};

} // namespace cratebox
