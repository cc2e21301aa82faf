#pragma once

#include <cratebox/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace cratebox {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

struct CommandOptions {
    std::string working_dir;
    // Added to (or overriding) the inherited environment
    std::vector<std::pair<std::string, std::string>> env;
    // 0 disables the timeout
    int timeout_seconds = 60;
};

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec plumbing failure or timeout; a missing binary
// shows up as exit code 127.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options = {});

// Like run_command, but a non-zero exit becomes a Process error whose
// message starts with `what`.
Result<CommandResult> run_checked(const std::vector<std::string>& args,
                                  const CommandOptions& options,
                                  const std::string& what);

// Strip trailing newlines and carriage returns
std::string trim_trailing_newlines(std::string s);

} // namespace cratebox
