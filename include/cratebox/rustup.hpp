#pragma once

#include <cratebox/tools.hpp>

namespace cratebox {

// The toolchain manager. Installed by downloading its installer from
// <rustup-dist-root>/<host-target>/rustup-init[.exe] and running it
// non-interactively with both homes redirected into the workspace.
class RustupTool : public Tool {
public:
    std::string name() const override { return "rustup"; }

    Status install(const Workspace& ws, bool fast_install) const override;

    // `rustup self update`, then `rustup update <main toolchain>`
    Status update(const Workspace& ws, bool fast_install) const override;

    static std::string installer_url(const Workspace& ws);
};

} // namespace cratebox
