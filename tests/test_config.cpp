#include <catch2/catch.hpp>
#include <cratebox/config.hpp>
#include "test_support.hpp"

using namespace cratebox;
using cratebox::testing::TempDir;

TEST_CASE("Parse a full config", "[config]") {
    auto r = Config::parse(R"(
[workspace]
cache-dir = "/var/cache/cratebox"
rustup-profile = "default"
fast-init = true
user-agent = "ci-runner/2.0"
command-timeout = 900

[registry]
crates-root = "http://mirror.local/crates"

[tools]
rustup-dist-root = "http://mirror.local/rustup/dist"
main-toolchain = "nightly"

[log]
level = "debug"
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.cache_dir == std::optional<std::string>("/var/cache/cratebox"));
    REQUIRE(cfg.rustup_profile == std::optional<std::string>("default"));
    REQUIRE(cfg.fast_init == std::optional<bool>(true));
    REQUIRE(cfg.user_agent == std::optional<std::string>("ci-runner/2.0"));
    REQUIRE(cfg.command_timeout == std::optional<int>(900));
    REQUIRE(cfg.crates_root == std::optional<std::string>("http://mirror.local/crates"));
    REQUIRE(cfg.rustup_dist_root ==
            std::optional<std::string>("http://mirror.local/rustup/dist"));
    REQUIRE(cfg.main_toolchain == std::optional<std::string>("nightly"));
    REQUIRE(cfg.log_level == std::optional<std::string>("debug"));
}

TEST_CASE("Parse an empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().cache_dir.has_value());
    REQUIRE_FALSE(r.value().fast_init.has_value());
    REQUIRE_FALSE(r.value().log_level.has_value());
}

TEST_CASE("Invalid TOML is a parse error", "[config]") {
    auto r = Config::parse("[workspace\ncache-dir = ");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrateboxError::Parse);
}

TEST_CASE("Negative command timeout is rejected", "[config]") {
    auto r = Config::parse("[workspace]\ncommand-timeout = -5\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrateboxError::Config);
}

TEST_CASE("Unknown log level is rejected", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"chatty\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CrateboxError::Config);
}

TEST_CASE("Unknown keys are ignored", "[config]") {
    auto r = Config::parse("[workspace]\nfrobnicate = 1\nfast-init = false\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().fast_init == std::optional<bool>(false));
}

TEST_CASE("Workspace config overrides global key by key", "[config]") {
    auto global = Config::parse(R"(
[workspace]
rustup-profile = "default"
user-agent = "global-agent"
[tools]
main-toolchain = "beta"
)").value();
    auto local = Config::parse(R"(
[workspace]
user-agent = "local-agent"
)").value();

    auto eff = Config::effective(global, local);
    REQUIRE(eff.rustup_profile == std::optional<std::string>("default"));
    REQUIRE(eff.user_agent == std::optional<std::string>("local-agent"));
    REQUIRE(eff.main_toolchain == std::optional<std::string>("beta"));

    auto none = Config::effective(std::nullopt, std::nullopt);
    REQUIRE_FALSE(none.user_agent.has_value());
}

TEST_CASE("Load config from file", "[config]") {
    TempDir td;
    td.write_file("cratebox.toml", "[registry]\ncrates-root = \"http://x\"\n");

    auto r = Config::load(td.path / "cratebox.toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().crates_root == std::optional<std::string>("http://x"));
}

TEST_CASE("Load errors carry the file path", "[config]") {
    TempDir td;
    auto missing = Config::load(td.path / "missing.toml");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == CrateboxError::IO);

    td.write_file("bad.toml", "[[[");
    auto bad = Config::load(td.path / "bad.toml");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().path == (td.path / "bad.toml").string());
}

TEST_CASE("global_config_path uses HOME", "[config]") {
    const char* old = std::getenv("HOME");
    std::string saved = old ? old : "";
    setenv("HOME", "/home/tester", 1);
    REQUIRE(global_config_path() == "/home/tester/.cratebox/config.toml");
    if (old) setenv("HOME", saved.c_str(), 1); else unsetenv("HOME");
}
