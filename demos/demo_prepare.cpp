// demo_prepare.cpp
//
// Fetch a crate into a workspace cache and copy its source out. Run it with:
//
//     ./cratebox-prepare <workspace> registry serde 1.0.200 <dest>
//     ./cratebox-prepare <workspace> git https://github.com/org/repo <dest>
//     ./cratebox-prepare <workspace> local ../my-crate <dest>
//     ./cratebox-prepare <workspace> install-tools
//
// Options come from ~/.cratebox/config.toml and <workspace>/cratebox.toml;
// CRATEBOX_LOG=debug shows what happens underneath.

#include <cratebox/crate.hpp>
#include <cratebox/log.hpp>
#include <cratebox/result.hpp>
#include <cratebox/tools.hpp>
#include <cratebox/workspace.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace cratebox;

static const char* kUsage =
    "usage: cratebox-prepare <workspace> registry <name> <version> <dest>\n"
    "       cratebox-prepare <workspace> git <url> <dest>\n"
    "       cratebox-prepare <workspace> local <path> <dest>\n"
    "       cratebox-prepare <workspace> install-tools";

struct Request {
    fs::path workspace;
    std::string kind;
    std::vector<std::string> operands;
};

static Result<Request> parse_args(int argc, char** argv) {
    if (argc < 3) {
        return CrateboxError{CrateboxError::InvalidArg,
            "missing arguments", kUsage};
    }
    Request req;
    req.workspace = argv[1];
    req.kind = argv[2];
    for (int i = 3; i < argc; ++i) req.operands.emplace_back(argv[i]);

    size_t expected = 0;
    if (req.kind == "registry") expected = 3;
    else if (req.kind == "git" || req.kind == "local") expected = 2;
    else if (req.kind == "install-tools") expected = 0;
    else {
        return CrateboxError{CrateboxError::InvalidArg,
            "unknown crate kind '" + req.kind + "'", kUsage};
    }

    if (req.operands.size() != expected) {
        return CrateboxError{CrateboxError::InvalidArg,
            "wrong number of arguments for '" + req.kind + "'", kUsage};
    }
    return Result<Request>::ok(std::move(req));
}

static Crate make_crate(const Request& req) {
    if (req.kind == "registry") return Crate::registry(req.operands[0], req.operands[1]);
    if (req.kind == "git") return Crate::git(req.operands[0]);
    return Crate::local(req.operands[0]);
}

static Status run(const Request& req) {
    auto ws = Workspace::open_with_config(req.workspace);
    if (ws.is_err()) return std::move(ws).error();

    if (req.kind == "install-tools") {
        return ws.value().install_tools(ToolRegistry::defaults());
    }

    Crate krate = make_crate(req);
    fs::path dest = req.operands.back();

    CRATEBOX_TRY(krate.fetch(ws.value()));
    CRATEBOX_TRY(krate.copy_source_to(ws.value(), dest));

    std::printf("prepared %s in %s\n", krate.to_string().c_str(), dest.c_str());
    if (krate.kind() == Crate::Kind::Git) {
        auto sha = krate.git_commit(ws.value());
        std::printf("commit %s\n", sha ? sha->c_str() : "(unknown)");
    }
    return ok_status();
}

int main(int argc, char** argv) {
    log::init_from_env();

    auto req = parse_args(argc, argv);
    if (req.is_err()) {
        std::fprintf(stderr, "%s\n", req.error().format().c_str());
        return 2;
    }

    auto status = run(req.value());
    if (status.is_err()) {
        log::error("%s", status.error().format().c_str());
        return 1;
    }
    return 0;
}
