// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/subprocess.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ferry::core {

namespace {

constexpr int POLL_SLICE_MS = 100;

std::error_code last_errno() noexcept {
    return {errno, std::system_category()};
}

// RAII file descriptor
struct Fd {
    int fd = -1;

    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    void reset() noexcept {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

void append_tail(std::string& out, const char* data, std::size_t n, std::size_t limit) {
    out.append(data, n);
    if (out.size() > limit) {
        out.erase(0, out.size() - limit);
    }
}

} // namespace

std::expected<SubprocessResult, std::error_code>
run_subprocess(const std::vector<std::string>& argv,
               std::stop_token stop,
               const SubprocessOptions& options) {
    if (argv.empty()) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) == -1) {
        return std::unexpected(last_errno());
    }
    Fd read_end(pipefd[0]);
    Fd write_end(pipefd[1]);

    pid_t pid = ::fork();
    if (pid == -1) {
        return std::unexpected(last_errno());
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull != -1) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(write_end.fd, STDOUT_FILENO);
        ::dup2(write_end.fd, STDERR_FILENO);
        if (!options.cwd.empty() && ::chdir(options.cwd.c_str()) != 0) {
            ::_exit(126);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    // Own process group, so stop reaches anything the child spawned
    ::setpgid(pid, pid);
    write_end.reset();

    SubprocessResult result;
    const auto started = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point term_sent{};
    bool term_pending = false;
    bool killed = false;

    char buffer[4096];
    for (;;) {
        pollfd pfd{read_end.fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, POLL_SLICE_MS);
        if (ready > 0) {
            ssize_t n = ::read(read_end.fd, buffer, sizeof(buffer));
            if (n > 0) {
                append_tail(result.output, buffer, static_cast<std::size_t>(n), options.output_limit);
            } else if (n == 0 || errno != EINTR) {
                break;  // EOF: every writer is gone
            }
        } else if (ready == -1 && errno != EINTR) {
            break;
        }

        // Checked on every pass so a chatty child cannot starve stop and timeout
        auto now = std::chrono::steady_clock::now();
        if (!term_pending) {
            if (stop.stop_requested()) {
                result.stopped = true;
            } else if (options.timeout.count() > 0 && now - started >= options.timeout) {
                result.timed_out = true;
            }
            if (result.stopped || result.timed_out) {
                ::kill(-pid, SIGTERM);
                term_sent = now;
                term_pending = true;
            }
        } else if (!killed && now - term_sent >= options.kill_grace) {
            spdlog::warn("{} ignored SIGTERM, killing pid {}", argv[0], pid);
            ::kill(-pid, SIGKILL);
            killed = true;
        }
    }
    read_end.reset();

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return std::unexpected(last_errno());
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }

    if (result.exit_code == 127) {
        spdlog::error("Failed to exec: {}", argv[0]);
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    return result;
}

std::string last_line(std::string_view output) {
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r' || output.back() == ' ')) {
        output.remove_suffix(1);
    }
    auto pos = output.find_last_of("\r\n");
    return std::string(pos == std::string_view::npos ? output : output.substr(pos + 1));
}

} // namespace ferry::core
