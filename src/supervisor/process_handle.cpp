#include "supervisor/process_handle.hpp"
#include "supervisor/executable_locator.hpp"
#include "core/logging.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>
#include <vector>

extern char** environ;

struct ChildRecord {
    std::mutex mutex;
    pid_t pid = -1;
    bool reaped = false;
    int exit_code = -1;
    int signal = 0;

    // Caller holds mutex. Whoever reaps first (output stream or kill)
    // records the status for the other.
    bool try_reap() {
        if (reaped) return true;
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            reaped = true;
            if (WIFEXITED(status)) {
                exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                signal = WTERMSIG(status);
            }
            return true;
        }
        if (r < 0 && errno == ECHILD) {
            reaped = true;
            return true;
        }
        return false;
    }
};

namespace {

constexpr std::size_t kMaxLineLength = 64 * 1024;

bool wait_for_reap(ChildRecord& child, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        {
            std::lock_guard<std::mutex> lock(child.mutex);
            if (child.try_reap()) return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void signal_group(pid_t pid, int sig) {
    // The child leads its own process group; fall back to the pid alone
    // if the group is already gone
    if (::kill(-pid, sig) != 0) {
        ::kill(pid, sig);
    }
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

// ── ProcessHandle ───────────────────────────────────────────

ProcessHandle::ProcessHandle(std::shared_ptr<ChildRecord> child) : child_(std::move(child)) {}

ProcessHandle::~ProcessHandle() {
    if (!is_alive()) return;
    auto result = kill();
    if (!result.success) {
        supervisor_logger()->warn("Releasing worker handle: {}", result.error);
    }
}

pid_t ProcessHandle::pid() const {
    return child_->pid;
}

bool ProcessHandle::is_alive() const {
    std::lock_guard<std::mutex> lock(child_->mutex);
    return !child_->try_reap();
}

ProcessHandle::KillResult ProcessHandle::kill(int grace_ms) {
    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(child_->mutex);
        if (child_->try_reap()) return {true, ""};
        pid = child_->pid;
    }

    signal_group(pid, SIGTERM);
    if (wait_for_reap(*child_, grace_ms)) {
        return {true, ""};
    }

    supervisor_logger()->warn("Worker (pid {}) ignored SIGTERM, sending SIGKILL", pid);
    signal_group(pid, SIGKILL);
    if (wait_for_reap(*child_, 2000)) {
        return {true, ""};
    }

    return {false, "Worker (pid " + std::to_string(pid) + ") did not exit after SIGKILL"};
}

// ── ProcessOutput ───────────────────────────────────────────

ProcessOutput::ProcessOutput(std::shared_ptr<ChildRecord> child,
                             int stdout_fd, int stderr_fd, int error_fd)
    : child_(std::move(child)),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      error_fd_(error_fd) {}

ProcessOutput::~ProcessOutput() {
    close_all();
    std::lock_guard<std::mutex> lock(child_->mutex);
    child_->try_reap();
}

bool ProcessOutput::next_event(ProcessEvent& event, int timeout_ms) {
    if (pending_.empty() && !terminal_queued_) {
        poll_fds(timeout_ms);

        bool reaped;
        {
            std::lock_guard<std::mutex> lock(child_->mutex);
            reaped = child_->try_reap();
        }
        if (reaped) {
            // Collect whatever the child wrote before it exited
            drain(stdout_fd_, stdout_buf_, ProcessEvent::Kind::StdoutLine);
            drain(stderr_fd_, stderr_buf_, ProcessEvent::Kind::StderrLine);
            read_exec_error();
            close_all();
            queue_terminal();
        }
    }

    if (pending_.empty()) return false;

    event = std::move(pending_.front());
    pending_.pop_front();
    if (event.is_terminal()) {
        terminal_delivered_ = true;
    }
    return true;
}

void ProcessOutput::poll_fds(int timeout_ms) {
    std::vector<struct pollfd> fds;
    for (int fd : {stdout_fd_, stderr_fd_, error_fd_}) {
        if (fd >= 0) {
            struct pollfd p;
            p.fd = fd;
            p.events = POLLIN;
            p.revents = 0;
            fds.push_back(p);
        }
    }

    // All pipes closed but the child has not exited yet
    if (fds.empty()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(timeout_ms, 50)));
        return;
    }

    int ret = poll(fds.data(), fds.size(), timeout_ms);
    if (ret <= 0) return;

    for (const auto& p : fds) {
        if (!(p.revents & (POLLIN | POLLHUP | POLLERR))) continue;
        if (p.fd == stdout_fd_) {
            drain(stdout_fd_, stdout_buf_, ProcessEvent::Kind::StdoutLine);
        } else if (p.fd == stderr_fd_) {
            drain(stderr_fd_, stderr_buf_, ProcessEvent::Kind::StderrLine);
        } else if (p.fd == error_fd_) {
            read_exec_error();
        }
    }
}

void ProcessOutput::drain(int& fd, std::string& buf, ProcessEvent::Kind kind) {
    if (fd < 0) return;

    char chunk[4096];
    bool eof = false;
    while (true) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buf.append(chunk, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;

        // EOF or hard error: the stream is done
        eof = true;
        break;
    }

    size_t pos;
    while ((pos = buf.find('\n')) != std::string::npos) {
        std::string line = buf.substr(0, pos);
        buf.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        ProcessEvent ev;
        ev.kind = kind;
        ev.text = std::move(line);
        pending_.push_back(std::move(ev));
    }

    // A line that never ends still has to come out
    if (eof || buf.size() > kMaxLineLength) {
        flush_partial(buf, kind);
    }
    if (eof) {
        close_fd(fd);
    }
}

void ProcessOutput::read_exec_error() {
    if (error_fd_ < 0) return;

    int err = 0;
    ssize_t n;
    do {
        n = read(error_fd_, &err, sizeof(err));
    } while (n < 0 && errno == EINTR);

    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;

    if (n == static_cast<ssize_t>(sizeof(err))) {
        exec_errno_ = err;
    }
    // Closed on successful exec, or after the errno arrived
    close_fd(error_fd_);
}

void ProcessOutput::flush_partial(std::string& buf, ProcessEvent::Kind kind) {
    if (buf.empty()) return;
    ProcessEvent ev;
    ev.kind = kind;
    ev.text = std::move(buf);
    buf.clear();
    pending_.push_back(std::move(ev));
}

void ProcessOutput::queue_terminal() {
    ProcessEvent ev;
    {
        std::lock_guard<std::mutex> lock(child_->mutex);
        ev.exit_code = child_->exit_code;
        ev.signal = child_->signal;
    }
    if (exec_errno_ != 0) {
        ev.kind = ProcessEvent::Kind::SpawnFailed;
        ev.text = std::strerror(exec_errno_);
    } else {
        ev.kind = ProcessEvent::Kind::Terminated;
    }
    pending_.push_back(std::move(ev));
    terminal_queued_ = true;
}

void ProcessOutput::close_all() {
    flush_partial(stdout_buf_, ProcessEvent::Kind::StdoutLine);
    flush_partial(stderr_buf_, ProcessEvent::Kind::StderrLine);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(error_fd_);
}

// ── spawn ───────────────────────────────────────────────────

SpawnResult spawn_process(const CommandSpec& command) {
    SpawnResult result;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    auto close_pipes = [&]() {
        int* pipes[] = {out_pipe, err_pipe, exec_pipe};
        for (int* p : pipes) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (pipe2(out_pipe, O_CLOEXEC) < 0 ||
        pipe2(err_pipe, O_CLOEXEC) < 0 ||
        pipe2(exec_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("Failed to create pipes: ") + std::strerror(errno);
        close_pipes();
        return result;
    }

    // Build argv/envp before fork; the child only does async-signal-safe work
    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        std::string key = kv.substr(0, kv.find('='));
        bool overridden = std::any_of(command.env.begin(), command.env.end(),
            [&](const std::pair<std::string, std::string>& o) { return o.first == key; });
        if (!overridden) {
            env_storage.push_back(std::move(kv));
        }
    }
    for (const auto& [key, value] : command.env) {
        env_storage.push_back(key + "=" + value);
    }

    std::vector<char*> envp;
    for (auto& kv : env_storage) {
        envp.push_back(kv.data());
    }
    envp.push_back(nullptr);

    std::vector<std::string> arg_storage;
    arg_storage.push_back(command.program);
    arg_storage.insert(arg_storage.end(), command.args.begin(), command.args.end());
    std::vector<char*> argv;
    for (auto& arg : arg_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork() failed: ") + std::strerror(errno);
        close_pipes();
        return result;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        // Every other pipe end is O_CLOEXEC

        environ = envp.data();
        execvp(argv[0], argv.data());

        // If execvp returns, it failed: report errno through the exec pipe
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    for (int fd : {out_pipe[0], err_pipe[0], exec_pipe[0]}) {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    auto child = std::make_shared<ChildRecord>();
    child->pid = pid;

    result.handle = std::make_unique<ProcessHandle>(child);
    result.output = std::make_unique<ProcessOutput>(child, out_pipe[0], err_pipe[0], exec_pipe[0]);
    result.success = true;

    supervisor_logger()->debug("Spawned {} (pid {})", command.to_string(), pid);
    return result;
}
