#pragma once

#include <cratebox/process.hpp>
#include <cratebox/result.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace cratebox {

class Workspace;

// An externally managed executable the workspace depends on
class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string name() const = 0;

    // Cheap and side-effect free: the binary exists and is executable.
    // Never runs the tool.
    virtual Result<bool> is_installed(const Workspace& ws) const;

    virtual Status install(const Workspace& ws, bool fast_install) const = 0;
    virtual Status update(const Workspace& ws, bool fast_install) const = 0;

    // <cargo-home>/bin/<name>[.exe]
    virtual std::filesystem::path binary_path(const Workspace& ws) const;

protected:
    // Environment for commands touching the managed toolchain homes
    static CommandOptions managed_command_options(const Workspace& ws);
};

// Ordered list of tools installed, or updated, at workspace setup. Order
// matters: a tool may rely on the ones before it (cargo-installed tools
// need the toolchain manager).
class ToolRegistry {
public:
    ToolRegistry() = default;
    explicit ToolRegistry(std::vector<std::shared_ptr<const Tool>> tools);

    // rustup, rustup-toolchain-install-master, git-credential-null
    static ToolRegistry defaults();

    ToolRegistry& add(std::shared_ptr<const Tool> tool);

    const std::vector<std::shared_ptr<const Tool>>& tools() const { return tools_; }
    const Tool* find(const std::string& name) const;

    // Update present tools, install missing ones and verify they appeared.
    // Stops at the first failure, naming the tool.
    Status install(const Workspace& ws, bool fast_install) const;

private:
    Status install_one(const Workspace& ws, const Tool& tool, bool fast_install) const;

    std::vector<std::shared_ptr<const Tool>> tools_;
};

} // namespace cratebox
