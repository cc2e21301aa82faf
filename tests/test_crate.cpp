#include <catch2/catch.hpp>
#include <cratebox/crate.hpp>
#include <cratebox/workspace.hpp>
#include "test_support.hpp"

#include <atomic>
#include <thread>

using namespace cratebox;
using namespace cratebox::testing;
namespace fs = std::filesystem;

TEST_CASE("crate display strings", "[crate]") {
    REQUIRE(Crate::registry("serde", "1.0.0").to_string() ==
            "crate serde 1.0.0 from registry");
    REQUIRE(Crate::git("https://github.com/o/r").to_string() ==
            "git crate at https://github.com/o/r");
    REQUIRE(Crate::local("/src/my-crate").to_string() ==
            "local crate at /src/my-crate");
}

TEST_CASE("crate kind follows the factory", "[crate]") {
    REQUIRE(Crate::registry("a", "1").kind() == Crate::Kind::Registry);
    REQUIRE(Crate::git("u").kind() == Crate::Kind::Git);
    REQUIRE(Crate::local("p").kind() == Crate::Kind::Local);
}

TEST_CASE("git_commit is absent for non-git crates", "[crate]") {
    TempDir td;
    WorkspaceOptions opts;
    opts.http = std::make_shared<FakeHttpClient>();
    auto ws = Workspace::open(td.path / "ws", opts).value();

    REQUIRE_FALSE(Crate::registry("a", "1.0.0").git_commit(ws).has_value());
    REQUIRE_FALSE(Crate::local(td.path).git_commit(ws).has_value());
}

TEST_CASE("copy_source_to replaces an existing destination", "[crate]") {
    TempDir td;
    td.write_file("crate/Cargo.toml", "fresh");
    td.write_file("dest/stale.txt", "left over from a previous build");
    td.write_file("dest/Cargo.toml", "old");

    WorkspaceOptions opts;
    opts.http = std::make_shared<FakeHttpClient>();
    auto ws = Workspace::open(td.path / "ws", opts).value();

    auto krate = Crate::local(td.path / "crate");
    REQUIRE(krate.copy_source_to(ws, td.path / "dest").is_ok());
    REQUIRE_FALSE(fs::exists(td.path / "dest" / "stale.txt"));
    REQUIRE(read_file(td.path / "dest" / "Cargo.toml") == "fresh");
}

TEST_CASE("source() exposes the backend", "[crate]") {
    auto krate = Crate::registry("serde", "1.0.0");
    const auto* reg = dynamic_cast<const RegistryCrate*>(&krate.source());
    REQUIRE(reg != nullptr);
    REQUIRE(reg->name() == "serde");
    REQUIRE(reg->version() == "1.0.0");
}

TEST_CASE("concurrent fetches of one crate download once", "[crate]") {
    TempDir td;
    auto http = std::make_shared<FakeHttpClient>();
    http->serve("https://static.crates.io/crates/foo/foo-1.0.0.crate",
                make_crate_tarball(td, "foo-1.0.0", {{"Cargo.toml", "x"}}));
    WorkspaceOptions opts;
    opts.http = http;
    auto ws = Workspace::open(td.path / "ws", opts).value();

    auto krate = Crate::registry("foo", "1.0.0");
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&] {
            if (krate.fetch(ws).is_err()) ++failures;
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(failures == 0);
    REQUIRE(http->requests().size() == 1);
}
