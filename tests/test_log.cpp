#include <catch2/catch.hpp>
#include <cratebox/log.hpp>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>

using namespace cratebox::log;

// Run `fn` with log output redirected to a temporary file
static std::string capture_log(std::function<void()> fn) {
    std::FILE* tmp = std::tmpfile();
    if (!tmp) return "";
    set_output(tmp);
    fn();
    set_output(nullptr);

    std::string output;
    std::rewind(tmp);
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    set_level(Trace);
    REQUIRE(get_level() == Trace);
    set_level(Error);
    REQUIRE(get_level() == Error);
    set_level(Info);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level accepts known names only", "[log]") {
    Level lvl = Info;
    REQUIRE(parse_level("debug", lvl));
    REQUIRE(lvl == Debug);
    REQUIRE(parse_level("warning", lvl));
    REQUIRE(lvl == Warn);

    REQUIRE_FALSE(parse_level("loud", lvl));
    REQUIRE(lvl == Warn);
}

TEST_CASE("init_from_env applies CRATEBOX_LOG", "[log]") {
    setenv("CRATEBOX_LOG", "error", 1);
    init_from_env();
    REQUIRE(get_level() == Error);

    setenv("CRATEBOX_LOG", "bogus", 1);
    init_from_env();
    REQUIRE(get_level() == Error);

    unsetenv("CRATEBOX_LOG");
    set_level(Info);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] { info("should not appear"); });
    REQUIRE(output.empty());
    REQUIRE_FALSE(enabled(Info));
    REQUIRE(enabled(Error));

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("warn: this is a warning") != std::string::npos);
    REQUIRE(output.find("error: this is an error") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_log([] { info("value: %d, name: %s", 42, "test"); });
    REQUIRE(output == "info: value: 42, name: test\n");
}
