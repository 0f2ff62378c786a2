#include "commands.hpp"
#include "config.hpp"
#include <cerrno>
#include <climits>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

using Clock = std::chrono::steady_clock;

// Owns one end of a pipe.
struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { reset(); }
    void reset() { if (fd >= 0) { ::close(fd); fd = -1; } }
};

double round4(double v) { return std::round(v * 10000.0) / 10000.0; }

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

CommandResult failed(const std::string& cmd, const std::string& why, Clock::time_point start) {
    CommandResult r;
    r.cmd = cmd;
    r.stderr_text = "ERROR: " + why;
    r.duration_sec = round4(seconds_since(start));
    return r;
}

// Drains whatever is readable on `fd` into `out`; returns false at EOF.
bool drain(Fd& fd, std::string& out) {
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd.fd, buf, sizeof(buf));
        if (n > 0) { out.append(buf, (size_t)n); continue; }
        if (n == 0) { fd.reset(); return false; }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        fd.reset();
        return false;
    }
}

}

Json::Value CommandResult::to_json(bool with_cmd) const {
    Json::Value j(Json::objectValue);
    if (with_cmd) j["cmd"] = cmd;
    j["ok"] = ok;
    j["code"] = code ? Json::Value(*code) : Json::Value();
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text;
    j["duration_sec"] = duration_sec;
    return j;
}

Json::Value BatchResult::to_json() const {
    Json::Value j(Json::objectValue);
    j["ok"] = ok;
    j["count"] = (Json::UInt64)results.size();
    Json::Value arr(Json::arrayValue);
    for (auto& r : results) arr.append(r.to_json(true));
    j["results"] = arr;
    j["duration_sec"] = duration_sec;
    return j;
}

CommandResult run_command(const std::string& cmd, std::optional<double> timeout_sec, const std::string& cwd) {
    auto start = Clock::now();

    if (!cwd.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(cwd, ec))
            return failed(cmd, "No such directory: '" + cwd + "'", start);
    }

    int out_p[2], err_p[2];
    if (::pipe2(out_p, O_CLOEXEC) < 0) return failed(cmd, std::string("pipe: ") + std::strerror(errno), start);
    Fd out_r(out_p[0]), out_w(out_p[1]);
    if (::pipe2(err_p, O_CLOEXEC) < 0) return failed(cmd, std::string("pipe: ") + std::strerror(errno), start);
    Fd err_r(err_p[0]), err_w(err_p[1]);

    const char* dir = cwd.empty() ? nullptr : cwd.c_str();
    pid_t pid = ::fork();
    if (pid < 0) return failed(cmd, std::string("fork: ") + std::strerror(errno), start);

    if (pid == 0) {
        // child: only async-signal-safe calls from here on
        ::setpgid(0, 0);
        if (dir && ::chdir(dir) != 0) ::_exit(127);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_w.fd, STDOUT_FILENO);
        ::dup2(err_w.fd, STDERR_FILENO);
        ::execl("/bin/sh", "sh", "-c", cmd.c_str(), (char*)nullptr);
        ::_exit(127);
    }

    out_w.reset();
    err_w.reset();
    ::fcntl(out_r.fd, F_SETFL, O_NONBLOCK);
    ::fcntl(err_r.fd, F_SETFL, O_NONBLOCK);

    CommandResult r;
    r.cmd = cmd;
    bool timed_out = false;
    if (timeout_sec && !(*timeout_sec <= cfg::MAX_COMMAND_TIMEOUT_SEC)) timeout_sec.reset();
    else if (timeout_sec && *timeout_sec < 0) timeout_sec = 0.0;
    auto deadline = timeout_sec ? start + std::chrono::duration_cast<Clock::duration>(
                                              std::chrono::duration<double>(*timeout_sec))
                                : Clock::time_point::max();

    while (out_r.fd >= 0 || err_r.fd >= 0) {
        int wait_ms = -1;
        if (timeout_sec) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            if (left <= 0) { timed_out = true; break; }
            wait_ms = left > INT_MAX ? INT_MAX : (int)left;
        }
        pollfd fds[2];
        nfds_t n = 0;
        if (out_r.fd >= 0) fds[n++] = {out_r.fd, POLLIN, 0};
        if (err_r.fd >= 0) fds[n++] = {err_r.fd, POLLIN, 0};
        int rc = ::poll(fds, n, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;
        if (out_r.fd >= 0) drain(out_r, r.stdout_text);
        if (err_r.fd >= 0) drain(err_r, r.stderr_text);
    }

    if (timed_out) {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (timed_out) {
        if (out_r.fd >= 0) drain(out_r, r.stdout_text);
        if (err_r.fd >= 0) drain(err_r, r.stderr_text);
        r.stderr_text += "\nTIMEOUT";
    } else if (WIFEXITED(status)) {
        r.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        r.code = -WTERMSIG(status);
    }
    r.ok = r.code && *r.code == 0;
    r.duration_sec = round4(seconds_since(start));
    return r;
}

BatchResult run_commands(const std::vector<std::string>& cmds, std::optional<double> timeout_sec,
                         const std::string& cwd, bool stop_on_error) {
    auto start = Clock::now();
    BatchResult batch;
    for (auto& c : cmds) {
        batch.results.push_back(run_command(c, timeout_sec, cwd));
        if (!batch.results.back().ok) {
            batch.ok = false;
            if (stop_on_error) break;
        }
    }
    batch.duration_sec = round4(seconds_since(start));
    return batch;
}
