#include <cratebox/tools.hpp>
#include <cratebox/binary_crate.hpp>
#include <cratebox/file_lock.hpp>
#include <cratebox/log.hpp>
#include <cratebox/native.hpp>
#include <cratebox/path.hpp>
#include <cratebox/rustup.hpp>
#include <cratebox/workspace.hpp>

#include <cstdlib>

namespace fs = std::filesystem;

namespace cratebox {

// ---------------------------------------------------------------------------
// Tool
// ---------------------------------------------------------------------------

fs::path Tool::binary_path(const Workspace& ws) const {
    return normalize_path(ws.cargo_home() / "bin" / (name() + EXE_SUFFIX));
}

Result<bool> Tool::is_installed(const Workspace& ws) const {
    return is_executable(binary_path(ws));
}

CommandOptions Tool::managed_command_options(const Workspace& ws) {
    CommandOptions opts;
    opts.timeout_seconds = ws.command_timeout();
    opts.env.emplace_back("CARGO_HOME", ws.cargo_home().string());
    opts.env.emplace_back("RUSTUP_HOME", ws.rustup_home().string());

    std::string path = (ws.cargo_home() / "bin").string();
    if (const char* inherited = std::getenv("PATH")) {
        path += ":";
        path += inherited;
    }
    opts.env.emplace_back("PATH", std::move(path));
    return opts;
}

// ---------------------------------------------------------------------------
// ToolRegistry
// ---------------------------------------------------------------------------

ToolRegistry::ToolRegistry(std::vector<std::shared_ptr<const Tool>> tools)
    : tools_(std::move(tools)) {}

ToolRegistry ToolRegistry::defaults() {
    ToolRegistry registry;
    registry.add(std::make_shared<RustupTool>())
            .add(std::make_shared<BinaryCrateTool>(
                BinaryCrateTool::rustup_toolchain_install_master()))
            .add(std::make_shared<BinaryCrateTool>(
                BinaryCrateTool::git_credential_null()));
    return registry;
}

ToolRegistry& ToolRegistry::add(std::shared_ptr<const Tool> tool) {
    tools_.push_back(std::move(tool));
    return *this;
}

const Tool* ToolRegistry::find(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool->name() == name) return tool.get();
    }
    return nullptr;
}

Status ToolRegistry::install_one(const Workspace& ws, const Tool& tool,
                                 bool fast_install) const {
    auto installed = tool.is_installed(ws);
    if (installed.is_err()) return std::move(installed).error();

    if (installed.value()) {
        log::info("tool %s is installed, trying to update it", tool.name().c_str());
        return tool.update(ws, fast_install)
            .context("failed to update tool " + tool.name());
    }

    log::info("tool %s is missing, installing it", tool.name().c_str());
    CRATEBOX_TRY(tool.install(ws, fast_install)
        .context("failed to install tool " + tool.name()));

    auto after = tool.is_installed(ws);
    if (after.is_err()) return std::move(after).error();
    if (!after.value()) {
        return CrateboxError{CrateboxError::Tool,
            "tool " + tool.name() + " is still missing after install",
            "expected an executable at " + tool.binary_path(ws).string(),
            tool.binary_path(ws).string()};
    }
    return ok_status();
}

Status ToolRegistry::install(const Workspace& ws, bool fast_install) const {
    for (const auto& tool : tools_) {
        CRATEBOX_TRY(with_file_lock(ws.lock_path("tool-" + tool->name()),
                                    "install " + tool->name(),
                                    [&] { return install_one(ws, *tool, fast_install); }));
    }
    return ok_status();
}

} // namespace cratebox
