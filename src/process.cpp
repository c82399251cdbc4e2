#include "process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace toolhost {

namespace {

// Per-stream capture limit; output past this is read and discarded.
constexpr size_t kMaxCaptureBytes = 16 * 1024 * 1024;

// After a kill, how long to wait for the pipes to reach EOF.
constexpr int kDrainAfterKillMs = 500;

struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() = default;
    ~Pipe() { close_both(); }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool open(int flags = 0) { return pipe2(fds, flags) == 0; }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }
    void close_read() { close_fd(fds[0]); }
    void close_write() { close_fd(fds[1]); }
    void close_both() { close_read(); close_write(); }

private:
    static void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        bool overridden = false;
        for (const auto& kv : overrides) {
            if (kv.first == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) env.push_back(std::move(entry));
    }
    for (const auto& kv : overrides) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}

std::vector<char*> as_c_array(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& s : items) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

// Child side of fork(): only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const ProcessOptions& opts, Pipe& out, Pipe& err, Pipe& status,
                             char* const* argv, char* const* envp) {
    setsid(); // own process group, detached from the controlling terminal

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }
    dup2(out.write_end(), STDOUT_FILENO);
    dup2(err.write_end(), STDERR_FILENO);
    out.close_both();
    err.close_both();
    status.close_read();

    if (!opts.working_dir.empty() && chdir(opts.working_dir.c_str()) != 0) {
        int e = errno;
        ssize_t n = write(status.write_end(), &e, sizeof(e));
        (void)n;
        _exit(127);
    }

    execvpe(argv[0], argv, envp);

    int e = errno;
    ssize_t n = write(status.write_end(), &e, sizeof(e));
    (void)n;
    _exit(127);
}

void append_capped(std::string& buf, const char* data, size_t len) {
    if (buf.size() >= kMaxCaptureBytes) return;
    buf.append(data, std::min(len, kMaxCaptureBytes - buf.size()));
}

// Read whatever is available; a slot's fd is set to -1 once it reaches EOF.
void pump(std::array<pollfd, 2>& pfds, std::array<std::string*, 2> sinks, int timeout_ms) {
    int ret = poll(pfds.data(), pfds.size(), timeout_ms);
    if (ret <= 0) return;

    std::array<char, 8192> buffer;
    for (size_t i = 0; i < pfds.size(); ++i) {
        if (pfds[i].fd < 0) continue;
        if ((pfds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
        ssize_t n = read(pfds[i].fd, buffer.data(), buffer.size());
        if (n > 0) {
            append_capped(*sinks[i], buffer.data(), static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            pfds[i].fd = -1; // EOF
        }
    }
}

bool all_closed(const std::array<pollfd, 2>& pfds) {
    return pfds[0].fd < 0 && pfds[1].fd < 0;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::vector<std::string> shell_argv(const std::string& shell, const std::string& command) {
    return {shell, "-c", command};
}

ProcessOutput run_process(const ProcessOptions& opts) {
    ProcessOutput result;

    if (opts.argv.empty() || opts.argv[0].empty()) {
        result.status = ProcessStatus::SpawnFailed;
        result.error = "No command given";
        return result;
    }

    Pipe out;
    Pipe err;
    Pipe status; // carries errno from a failed chdir/exec; closed by exec on success
    if (!out.open() || !err.open() || !status.open(O_CLOEXEC)) {
        result.status = ProcessStatus::SpawnFailed;
        result.error = std::string("Failed to create pipes: ") + std::strerror(errno);
        return result;
    }

    // Everything the child needs is prepared before fork()
    std::vector<std::string> argv_storage = opts.argv;
    std::vector<std::string> env_storage = build_environment(opts.env);
    std::vector<char*> argv = as_c_array(argv_storage);
    std::vector<char*> envp = as_c_array(env_storage);

    pid_t pid = fork();
    if (pid < 0) {
        result.status = ProcessStatus::SpawnFailed;
        result.error = std::string("Failed to fork process: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        exec_child(opts, out, err, status, argv.data(), envp.data());
    }

    out.close_write();
    err.close_write();
    status.close_write();

    int child_errno = 0;
    ssize_t got;
    do {
        got = read(status.read_end(), &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    status.close_read();

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        int wstatus = 0;
        waitpid(pid, &wstatus, 0);
        result.status = ProcessStatus::SpawnFailed;
        result.error = std::strerror(child_errno);
        return result;
    }

    std::array<pollfd, 2> pfds{};
    pfds[0].fd = out.read_end();
    pfds[0].events = POLLIN;
    pfds[1].fd = err.read_end();
    pfds[1].events = POLLIN;
    std::array<std::string*, 2> sinks = {&result.stdout_data, &result.stderr_data};

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(opts.timeout_ms);
    bool timed_out = false;

    while (!all_closed(pfds)) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }
        pump(pfds, sinks, static_cast<int>(std::min<long long>(remaining, 1000)));
    }

    if (timed_out) {
        kill(-pid, SIGKILL);
        auto drain_deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(kDrainAfterKillMs);
        while (!all_closed(pfds) && std::chrono::steady_clock::now() < drain_deadline) {
            pump(pfds, sinks, 50);
        }
    }

    // The pipes can close before the child exits (e.g. it redirected
    // both streams), so the deadline still applies while reaping.
    int wstatus = 0;
    while (true) {
        pid_t r = waitpid(pid, &wstatus, timed_out ? 0 : WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            kill(-pid, SIGKILL);
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    result.exit_code = decode_status(wstatus);
    result.status = timed_out ? ProcessStatus::TimedOut : ProcessStatus::Exited;
    return result;
}

} // namespace toolhost
