#include "process/Subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#include "tui/Signal.hpp"

namespace {
using Clock = std::chrono::steady_clock;

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Writes everything it can; a reader that went away ends the write quietly.
void WriteAll(int fd, const std::string& data) {
    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return;
        }
        offset += static_cast<std::size_t>(n);
    }
}

int RemainingMs(const Clock::time_point& deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

[[noreturn]] void ExecChild(const std::vector<std::string>& argv, const std::vector<std::string>& unset_env) {
    std::signal(SIGPIPE, SIG_DFL);
    std::signal(SIGINT, SIG_DFL);
    for (const std::string& name : unset_env) {
        unsetenv(name.c_str());
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const std::string& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    execvp(args[0], args.data());
    _exit(127);
}
}

ProcessResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::runtime_error("empty command line");
    }
    if (options.feed_stdin) {
        IgnoreSigpipe();
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    if (options.feed_stdin && pipe(stdin_pipe) < 0) {
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (options.capture_stdout && pipe(stdout_pipe) < 0) {
        CloseFd(stdin_pipe[0]);
        CloseFd(stdin_pipe[1]);
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }

    const bool own_group = options.timeout_ms > 0;
    const pid_t pid = fork();
    if (pid < 0) {
        CloseFd(stdin_pipe[0]);
        CloseFd(stdin_pipe[1]);
        CloseFd(stdout_pipe[0]);
        CloseFd(stdout_pipe[1]);
        throw std::runtime_error(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Timed children get their own group so helpers they spawn die with them.
        // Interactive children (fzf) must stay in the terminal's foreground group.
        if (own_group) {
            setpgid(0, 0);
        }
        if (options.feed_stdin) {
            dup2(stdin_pipe[0], STDIN_FILENO);
        } else {
            const int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }
        }
        if (options.capture_stdout) {
            dup2(stdout_pipe[1], STDOUT_FILENO);
        }
        if (options.discard_stderr) {
            const int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
        }
        CloseFd(stdin_pipe[0]);
        CloseFd(stdin_pipe[1]);
        CloseFd(stdout_pipe[0]);
        CloseFd(stdout_pipe[1]);
        ExecChild(argv, options.unset_env);
    }

    CloseFd(stdin_pipe[0]);
    CloseFd(stdout_pipe[1]);

    auto kill_child = [pid, own_group]() {
        if (own_group) {
            kill(-pid, SIGKILL);
        }
        kill(pid, SIGKILL);
    };

    std::thread writer;
    if (options.feed_stdin) {
        int fd = stdin_pipe[1];
        writer = std::thread([fd, &options]() {
            WriteAll(fd, options.input);
            close(fd);
        });
    }

    ProcessResult result;
    const bool bounded = options.timeout_ms > 0;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(options.timeout_ms);

    if (options.capture_stdout) {
        char chunk[4096];
        while (true) {
            pollfd pfd{};
            pfd.fd = stdout_pipe[0];
            pfd.events = POLLIN;
            const int wait_ms = bounded ? RemainingMs(deadline) : -1;
            const int ready = poll(&pfd, 1, wait_ms);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ready == 0) {
                result.timed_out = true;
                kill_child();
                break;
            }
            const ssize_t n = read(stdout_pipe[0], chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                break;
            }
            if (n == 0) {
                break;
            }
            result.output.append(chunk, static_cast<std::size_t>(n));
            if (options.max_output > 0 && result.output.size() >= options.max_output) {
                result.output.resize(options.max_output);
                result.truncated = true;
                kill_child();
                break;
            }
        }
        CloseFd(stdout_pipe[0]);
    }

    int status = 0;
    while (true) {
        const pid_t done = waitpid(pid, &status, bounded && !result.timed_out ? WNOHANG : 0);
        if (done == pid) {
            break;
        }
        if (done < 0) {
            if (errno == EINTR) {
                continue;
            }
            status = -1;
            break;
        }
        if (RemainingMs(deadline) == 0) {
            result.timed_out = true;
            kill_child();
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (writer.joinable()) {
        writer.join();
    }

    if (status != -1 && !result.timed_out && !result.truncated) {
        result.exit_code = DecodeStatus(status);
    }
    return result;
}

int RunOnTerminal(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::runtime_error("empty command line");
    }

    const int tty = open("/dev/tty", O_RDWR);
    const pid_t pid = fork();
    if (pid < 0) {
        if (tty >= 0) {
            close(tty);
        }
        throw std::runtime_error(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        if (tty >= 0) {
            dup2(tty, STDIN_FILENO);
            dup2(tty, STDOUT_FILENO);
            dup2(tty, STDERR_FILENO);
            close(tty);
        } else {
            // Without a terminal keep stdout clean for the shell wrapper.
            dup2(STDERR_FILENO, STDOUT_FILENO);
        }
        ExecChild(argv, {});
    }

    if (tty >= 0) {
        close(tty);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return DecodeStatus(status);
}

std::string FindExecutable(const std::string& name) {
    if (name.empty()) {
        return "";
    }
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    const std::string path = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find(':', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        const std::string candidate = dir + "/" + name;
        struct stat st {};
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return "";
}

std::string SelfExecutable() {
    char buffer[4096];
    const ssize_t n = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (n <= 0) {
        return "fzd";
    }
    return std::string(buffer, static_cast<std::size_t>(n));
}

std::string ShellQuote(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out += "'";
    return out;
}
