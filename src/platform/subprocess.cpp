#include "wsk/subprocess.hpp"

#include <cerrno>
#include <cstring>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

#include <spdlog/spdlog.h>

namespace wsk {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollIntervalMs = 50;

#ifndef _WIN32

bool is_executable(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
}

// Close-on-exec so children spawned by other threads never inherit our pipes
bool make_pipe(int fds[2]) {
#ifdef __linux__
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) return false;
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string lookup_path_value(const std::vector<std::string>& envp) {
    for (const auto& entry : envp) {
        if (entry.rfind("PATH=", 0) == 0) {
            return entry.substr(5);
        }
    }
    return "";
}

// Drain whatever is readable on fd; returns false at EOF or error
bool read_available(int fd, OutputStream stream, SubprocessResult& result) {
    char buffer[4096];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        std::string text(buffer, static_cast<size_t>(n));
        if (stream == OutputStream::Stdout) {
            result.stdout_text += text;
        } else {
            result.stderr_text += text;
        }
        // Merge consecutive reads from the same stream
        if (!result.output.empty() && result.output.back().stream == stream) {
            result.output.back().text += text;
        } else {
            result.output.push_back({stream, std::move(text)});
        }
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

#endif // !_WIN32

} // namespace

std::optional<std::string> find_program(const std::string& name, const std::string& path_value) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) return name;

#ifndef _WIN32
    size_t start = 0;
    while (start <= path_value.size()) {
        size_t end = path_value.find(':', start);
        if (end == std::string::npos) end = path_value.size();
        std::string dir = path_value.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
#else
    (void)path_value;
#endif
    return std::nullopt;
}

SubprocessResult run_subprocess(const SubprocessRequest& request) {
    SubprocessResult result;
    auto started_at = Clock::now();

#ifdef _WIN32
    (void)request;
    result.error = "subprocess execution is not implemented on Windows";
    return result;
#else
    if (request.argv.empty()) {
        result.error = "missing command";
        return result;
    }

    auto program = find_program(request.argv[0], lookup_path_value(request.envp));
    if (!program) {
        result.error = "command not found: " + request.argv[0];
        return result;
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& s : request.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    envp.reserve(request.envp.size() + 1);
    for (const auto& s : request.envp) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe)) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    const char* cwd = request.cwd.empty() ? nullptr : request.cwd.c_str();
    const char* path = program->c_str();

    pid_t pid = ::fork();
    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::close(exec_pipe[0]);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }

        if (cwd && ::chdir(cwd) != 0) {
            int err = errno;
            ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        ::execve(path, argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        result.error = (cwd ? "cannot start in " + request.cwd + ": " : std::string("exec failed: ")) +
                       std::string(strerror(child_errno));
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - started_at);
        return result;
    }

    result.started = true;
    spdlog::trace("spawned pid {}: {}", pid, request.argv[0]);

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    bool term_sent = false;
    bool kill_sent = false;
    bool reaped = false;
    int status = 0;
    Clock::time_point kill_deadline;

    auto terminate = [&]() {
        if (term_sent) return;
        ::kill(-pid, SIGTERM);
        term_sent = true;
        kill_deadline = Clock::now() + request.grace_period;
    };

    // The child is polled even after both pipes close, so timeouts and
    // cancellation still apply to commands that detach their output
    while (true) {
        bool pipes_open = out_fd >= 0 || err_fd >= 0;
        if (reaped && !pipes_open) break;

        pollfd fds[2];
        nfds_t count = 0;
        int out_index = -1;
        int err_index = -1;
        if (out_fd >= 0) {
            out_index = static_cast<int>(count);
            fds[count++] = {out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            err_index = static_cast<int>(count);
            fds[count++] = {err_fd, POLLIN, 0};
        }

        int ready = ::poll(fds, count, reaped ? 0 : kPollIntervalMs);
        if (ready < 0 && errno != EINTR) {
            spdlog::warn("poll failed for pid {}: {}", pid, strerror(errno));
            terminate();
        }

        if (ready > 0) {
            if (out_index >= 0 && (fds[out_index].revents & (POLLIN | POLLHUP | POLLERR))) {
                if (!read_available(out_fd, OutputStream::Stdout, result)) close_fd(out_fd);
            }
            if (err_index >= 0 && (fds[err_index].revents & (POLLIN | POLLHUP | POLLERR))) {
                if (!read_available(err_fd, OutputStream::Stderr, result)) close_fd(err_fd);
            }
        }

        if (reaped) {
            // Drained; descendants that escaped the group may hold the pipes open
            if (ready <= 0) break;
            continue;
        }

        auto now = Clock::now();
        if (!term_sent && request.timeout && now - started_at >= *request.timeout) {
            spdlog::debug("pid {} exceeded timeout of {}ms", pid, request.timeout->count());
            result.timed_out = true;
            terminate();
        }
        if (!term_sent && request.cancel && request.cancel->load()) {
            result.cancelled = true;
            terminate();
        }
        if (term_sent && !kill_sent && now >= kill_deadline) {
            ::kill(-pid, SIGKILL);
            kill_sent = true;
        }

        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
        } else if (waited < 0 && errno != EINTR) {
            spdlog::warn("waitpid failed for pid {}: {}", pid, strerror(errno));
            reaped = true;
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - started_at);
    return result;
#endif
}

} // namespace wsk
