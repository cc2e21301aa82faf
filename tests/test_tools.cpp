#include <catch2/catch.hpp>
#include <cratebox/binary_crate.hpp>
#include <cratebox/native.hpp>
#include <cratebox/rustup.hpp>
#include <cratebox/tools.hpp>
#include <cratebox/workspace.hpp>
#include "test_support.hpp"

using namespace cratebox;
using namespace cratebox::testing;
namespace fs = std::filesystem;

namespace {

struct FakeTool : Tool {
    std::string tool_name;
    bool creates_binary = true;
    bool fail_update = false;
    mutable int installs = 0;
    mutable int updates = 0;
    mutable bool last_fast = false;

    explicit FakeTool(std::string n) : tool_name(std::move(n)) {}

    std::string name() const override { return tool_name; }

    Status install(const Workspace& ws, bool fast_install) const override {
        ++installs;
        last_fast = fast_install;
        if (!creates_binary) return ok_status();
        fs::path bin = binary_path(ws);
        fs::create_directories(bin.parent_path());
        std::ofstream(bin) << "#!/bin/sh\n";
        return make_executable(bin);
    }

    Status update(const Workspace&, bool) const override {
        ++updates;
        if (fail_update) {
            return CrateboxError{CrateboxError::Process, "network unreachable"};
        }
        return ok_status();
    }
};

Workspace open_ws(TempDir& td, std::shared_ptr<HttpClient> http = nullptr) {
    WorkspaceOptions opts;
    opts.http = http ? http : std::make_shared<FakeHttpClient>();
    return Workspace::open(td.path / "ws", opts).value();
}

void write_script(const fs::path& path, const std::string& body) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << "#!/bin/sh\n" << body;
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
}

} // namespace

TEST_CASE("missing tools are installed and verified", "[tools]") {
    TempDir td;
    auto ws = open_ws(td);
    auto tool = std::make_shared<FakeTool>("fake-tool");

    ToolRegistry registry({tool});
    REQUIRE_FALSE(tool->is_installed(ws).value());
    REQUIRE(registry.install(ws, true).is_ok());
    REQUIRE(tool->installs == 1);
    REQUIRE(tool->updates == 0);
    REQUIRE(tool->last_fast);
    REQUIRE(tool->is_installed(ws).value());
}

TEST_CASE("present tools are updated instead", "[tools]") {
    TempDir td;
    auto ws = open_ws(td);
    auto tool = std::make_shared<FakeTool>("fake-tool");
    ToolRegistry registry({tool});

    REQUIRE(registry.install(ws, false).is_ok());
    REQUIRE(registry.install(ws, false).is_ok());
    REQUIRE(tool->installs == 1);
    REQUIRE(tool->updates == 1);
}

TEST_CASE("a tool missing after install stops the sequence", "[tools]") {
    TempDir td;
    auto ws = open_ws(td);
    auto broken = std::make_shared<FakeTool>("broken");
    broken->creates_binary = false;
    auto next = std::make_shared<FakeTool>("next");

    ToolRegistry registry({broken, next});
    auto r = registry.install(ws, false);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrateboxError::Tool);
    REQUIRE(r.error().message.find("broken") != std::string::npos);
    REQUIRE(next->installs == 0);
}

TEST_CASE("update failures name the tool", "[tools]") {
    TempDir td;
    auto ws = open_ws(td);
    auto tool = std::make_shared<FakeTool>("flaky");
    ToolRegistry registry({tool});
    REQUIRE(registry.install(ws, false).is_ok());

    tool->fail_update = true;
    auto r = registry.install(ws, false);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "failed to update tool flaky: network unreachable");
}

TEST_CASE("install_tools uses the workspace fast-init flag", "[tools]") {
    TempDir td;
    WorkspaceOptions opts;
    opts.http = std::make_shared<FakeHttpClient>();
    opts.fast_init = true;
    auto ws = Workspace::open(td.path / "ws", opts).value();

    auto tool = std::make_shared<FakeTool>("fake-tool");
    REQUIRE(ws.install_tools(ToolRegistry({tool})).is_ok());
    REQUIRE(tool->last_fast);
}

TEST_CASE("default registry order", "[tools]") {
    auto registry = ToolRegistry::defaults();
    REQUIRE(registry.tools().size() == 3);
    REQUIRE(registry.tools()[0]->name() == "rustup");
    REQUIRE(registry.tools()[1]->name() == "rustup-toolchain-install-master");
    REQUIRE(registry.tools()[2]->name() == "git-credential-null");
    REQUIRE(registry.find("git-credential-null") != nullptr);
    REQUIRE(registry.find("cargo") == nullptr);
}

TEST_CASE("binary crate tool naming", "[tools]") {
    TempDir td;
    auto ws = open_ws(td);

    BinaryCrateTool plain("git-credential-null", "git-credential-null");
    REQUIRE(plain.name() == "git-credential-null");
    REQUIRE(plain.binary_path(ws).filename() == std::string("git-credential-null") + EXE_SUFFIX);

    BinaryCrateTool sub("cargo-sweep", "sweep", std::string("sweep"));
    REQUIRE(sub.name() == "cargo-sweep");
    REQUIRE(sub.crate_name() == "cargo-sweep");
}

TEST_CASE("binary crate tool runs cargo install", "[tools]") {
    TempDir td;
    auto ws = open_ws(td);
    write_script(ws.cargo_home() / "bin" / "cargo",
                 "echo \"$@\" >> \"$CARGO_HOME/cargo-calls\"\n"
                 "printf '#!/bin/sh\\n' > \"$CARGO_HOME/bin/$2\"\n"
                 "chmod +x \"$CARGO_HOME/bin/$2\"\n");

    auto tool = std::make_shared<BinaryCrateTool>(BinaryCrateTool::git_credential_null());
    ToolRegistry registry({tool});
    REQUIRE(registry.install(ws, true).is_ok());
    REQUIRE(tool->is_installed(ws).value());
    REQUIRE(read_file(ws.cargo_home() / "cargo-calls") ==
            "install git-credential-null --debug\n");

    // Present now, so the next pass reinstalls through update
    REQUIRE(registry.install(ws, false).is_ok());
    REQUIRE(read_file(ws.cargo_home() / "cargo-calls") ==
            "install git-credential-null --debug\ninstall git-credential-null\n");
}

TEST_CASE("binary crate tool reports a failing cargo", "[tools]") {
    TempDir td;
    auto ws = open_ws(td);
    write_script(ws.cargo_home() / "bin" / "cargo", "echo 'error: no network' >&2\nexit 101\n");

    ToolRegistry registry({std::make_shared<BinaryCrateTool>(
        BinaryCrateTool::rustup_toolchain_install_master())});
    auto r = registry.install(ws, false);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("failed to install tool rustup-toolchain-install-master") == 0);
    REQUIRE(r.error().message.find("no network") != std::string::npos);
}

TEST_CASE("rustup installer url", "[tools]") {
    TempDir td;
    WorkspaceOptions opts;
    opts.http = std::make_shared<FakeHttpClient>();
    opts.rustup_dist_root = "http://mirror.local/dist/";
    auto ws = Workspace::open(td.path / "ws", opts).value();

    REQUIRE(RustupTool::installer_url(ws) ==
            "http://mirror.local/dist/" + host_target() + "/rustup-init" + EXE_SUFFIX);
}

TEST_CASE("rustup install then update", "[tools]") {
    TempDir td;
    auto http = std::make_shared<FakeHttpClient>();
    auto ws = open_ws(td, http);

    // The installer drops a rustup that records its arguments
    http->serve(RustupTool::installer_url(ws),
        "#!/bin/sh\n"
        "echo \"$@\" > \"$CARGO_HOME/installer-args\"\n"
        "mkdir -p \"$CARGO_HOME/bin\"\n"
        "printf '#!/bin/sh\\necho \"$@\" >> \"$CARGO_HOME/rustup-calls\"\\n' > \"$CARGO_HOME/bin/rustup\"\n"
        "chmod +x \"$CARGO_HOME/bin/rustup\"\n");

    ToolRegistry registry({std::make_shared<RustupTool>()});
    REQUIRE(registry.install(ws, false).is_ok());
    REQUIRE(read_file(ws.cargo_home() / "installer-args") ==
            "-y --no-modify-path --default-toolchain stable --profile minimal\n");
    REQUIRE(RustupTool().is_installed(ws).value());

    REQUIRE(registry.install(ws, false).is_ok());
    REQUIRE(read_file(ws.cargo_home() / "rustup-calls") == "self update\nupdate stable\n");
    REQUIRE(http->requests().size() == 1);
}

TEST_CASE("rustup install fails when the installer cannot be downloaded", "[tools]") {
    TempDir td;
    auto ws = open_ws(td);

    ToolRegistry registry({std::make_shared<RustupTool>()});
    auto r = registry.install(ws, false);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrateboxError::Network);
    REQUIRE(r.error().message.find("failed to install tool rustup") == 0);
}
