#pragma once

#include <deque>
#include <memory>
#include <string>
#include <sys/types.h>

struct CommandSpec;
struct ChildRecord;

struct ProcessEvent {
    enum class Kind {
        StdoutLine,
        StderrLine,
        Terminated,
        SpawnFailed,
    };

    Kind kind = Kind::StdoutLine;
    std::string text;     // output line, or the exec error for SpawnFailed
    int exit_code = -1;   // -1 when killed by a signal
    int signal = 0;

    bool is_terminal() const {
        return kind == Kind::Terminated || kind == Kind::SpawnFailed;
    }
};

/// Kill capability for a spawned worker. Destroying a handle whose child is
/// still alive terminates the child.
class ProcessHandle {
public:
    explicit ProcessHandle(std::shared_ptr<ChildRecord> child);
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    pid_t pid() const;

    /// True until the child has been reaped
    bool is_alive() const;

    struct KillResult { bool success; std::string error; };
    /// SIGTERM the child's process group, wait up to grace_ms, then SIGKILL
    KillResult kill(int grace_ms = 5000);

private:
    std::shared_ptr<ChildRecord> child_;
};

/// The child's stdout/stderr and termination, as a stream of events.
/// Ends with exactly one terminal event (Terminated or SpawnFailed).
class ProcessOutput {
public:
    ProcessOutput(std::shared_ptr<ChildRecord> child, int stdout_fd, int stderr_fd, int error_fd);
    ~ProcessOutput();

    ProcessOutput(const ProcessOutput&) = delete;
    ProcessOutput& operator=(const ProcessOutput&) = delete;

    /// Wait up to timeout_ms for the next event. Returns false if nothing
    /// arrived in time, or once the terminal event has been delivered.
    bool next_event(ProcessEvent& event, int timeout_ms);

    /// True after the terminal event has been delivered
    bool exhausted() const { return terminal_delivered_; }

private:
    std::shared_ptr<ChildRecord> child_;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int error_fd_ = -1;        // close-on-exec pipe carrying errno of a failed exec
    int exec_errno_ = 0;
    std::string stdout_buf_;
    std::string stderr_buf_;
    std::deque<ProcessEvent> pending_;
    bool terminal_queued_ = false;
    bool terminal_delivered_ = false;

    void poll_fds(int timeout_ms);
    void drain(int& fd, std::string& buf, ProcessEvent::Kind kind);
    void read_exec_error();
    void flush_partial(std::string& buf, ProcessEvent::Kind kind);
    void queue_terminal();
    void close_all();
};

struct SpawnResult {
    bool success = false;
    std::string error;
    std::unique_ptr<ProcessHandle> handle;
    std::unique_ptr<ProcessOutput> output;
};

/// fork + exec the command in its own process group, with stdout/stderr
/// piped back and env overrides applied on top of our environment
SpawnResult spawn_process(const CommandSpec& command);
