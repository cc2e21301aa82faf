#include <cratebox/process.hpp>
#include <cratebox/log.hpp>

#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <map>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace cratebox {

static void close_pipes(int out_fd, int err_fd) {
    close(out_fd);
    close(err_fd);
}

static void drain(int fd, std::string& into) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        into.append(buf, static_cast<size_t>(n));
    }
}

// The inherited environment with `overrides` applied, as KEY=VALUE strings.
// A key overridden twice keeps its last value.
static std::vector<std::string> build_environment(
        const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::map<std::string, std::string> merged;
    std::vector<std::string> order;
    auto set = [&](const std::string& key, const std::string& value) {
        if (merged.find(key) == merged.end()) order.push_back(key);
        merged[key] = value;
    };

    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        size_t eq = entry.find('=');
        if (eq == std::string::npos) continue;
        set(entry.substr(0, eq), entry.substr(eq + 1));
    }
    for (const auto& [key, value] : overrides) set(key, value);

    std::vector<std::string> env;
    env.reserve(order.size());
    for (const auto& key : order) env.push_back(key + "=" + merged[key]);
    return env;
}

// Search PATH from the child's environment for `program`, the way execvp
// would; names with a slash are used as given
static std::string resolve_program(const std::string& program,
                                   const std::vector<std::string>& env) {
    if (program.find('/') != std::string::npos) return program;

    std::string search_path = "/usr/local/bin:/usr/bin:/bin";
    for (const auto& e : env) {
        if (e.compare(0, 5, "PATH=") == 0) {
            search_path = e.substr(5);
            break;
        }
    }

    size_t start = 0;
    while (start <= search_path.size()) {
        size_t end = search_path.find(':', start);
        if (end == std::string::npos) end = search_path.size();
        std::string dir = search_path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) return candidate;
        start = end + 1;
    }
    return program;
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options) {
    if (args.empty()) {
        return CrateboxError{CrateboxError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    // Everything the child needs is allocated before fork: only
    // async-signal-safe calls may run between fork and exec
    std::vector<std::string> env_strings = build_environment(options.env);
    std::vector<const char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (const auto& e : env_strings) envp.push_back(e.c_str());
    envp.push_back(nullptr);
    std::string program = resolve_program(args[0], env_strings);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return CrateboxError{CrateboxError::Process,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close_pipes(stdout_pipe[0], stdout_pipe[1]);
        return CrateboxError{CrateboxError::Process,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close_pipes(stdout_pipe[0], stdout_pipe[1]);
        close_pipes(stderr_pipe[0], stderr_pipe[1]);
        return CrateboxError{CrateboxError::Process,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!options.working_dir.empty()) {
            if (chdir(options.working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execve(program.c_str(), const_cast<char* const*>(argv.data()),
               const_cast<char* const*>(envp.data()));
        _exit(127);  // execve failed
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        if (options.timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= options.timeout_seconds) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close_pipes(stdout_pipe[0], stderr_pipe[0]);
                return CrateboxError{CrateboxError::Process,
                    "command '" + args[0] + "' timed out after " +
                    std::to_string(options.timeout_seconds) + "s"};
            }
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close_pipes(stdout_pipe[0], stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0 && errno != EINTR) {
            close_pipes(stdout_pipe[0], stderr_pipe[0]);
            return CrateboxError{CrateboxError::Process,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);
    }
}

Result<CommandResult> run_checked(const std::vector<std::string>& args,
                                  const CommandOptions& options,
                                  const std::string& what) {
    auto r = run_command(args, options);
    if (r.is_err()) return std::move(r).error().context(what);

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        std::string msg = what + ": '" + args[0] + "' exited with code " +
                          std::to_string(cmd.exit_code);
        std::string stderr_text = trim_trailing_newlines(cmd.stderr_str);
        if (!stderr_text.empty()) {
            msg += "\n" + stderr_text;
        }
        return CrateboxError{CrateboxError::Process, std::move(msg)};
    }
    return r;
}

std::string trim_trailing_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

} // namespace cratebox
