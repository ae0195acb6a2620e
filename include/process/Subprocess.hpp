#ifndef PROCESS_SUBPROCESS_HPP
#define PROCESS_SUBPROCESS_HPP

#include <cstddef>
#include <string>
#include <vector>

struct ProcessOptions {
    // Written to the child's stdin when feed_stdin is set; otherwise stdin is /dev/null.
    std::string input;
    bool feed_stdin = false;
    // When false the child inherits our stdout.
    bool capture_stdout = true;
    bool discard_stderr = false;
    // 0 means wait forever. A timed-out child (and its process group) is killed.
    int timeout_ms = 0;
    // 0 means unbounded. Reaching the cap stops the child.
    std::size_t max_output = 0;
    // Removed from the child's environment.
    std::vector<std::string> unset_env;
};

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    bool truncated = false;
    std::string output;
};

// Spawns argv[0] from PATH. Throws std::runtime_error if the child cannot be started.
ProcessResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options);

// Runs with stdin/stdout/stderr on /dev/tty and waits. Returns the exit status.
int RunOnTerminal(const std::vector<std::string>& argv);

// Absolute path of an executable found on PATH, or "" when missing.
std::string FindExecutable(const std::string& name);

// Path of the running binary, used for picker callbacks.
std::string SelfExecutable();

// Single-quotes text for the shell fzf uses to run bindings.
std::string ShellQuote(const std::string& text);

#endif // PROCESS_SUBPROCESS_HPP
