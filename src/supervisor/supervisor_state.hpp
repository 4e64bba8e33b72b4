#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <sys/types.h>

class ProcessHandle;

enum class WorkerStatus {
    Stopped,
    Starting,
    Running,
    Crashed,
};

const char* to_string(WorkerStatus status);

struct StateSnapshot {
    WorkerStatus status = WorkerStatus::Stopped;
    bool has_process = false;
    pid_t pid = -1;
    unsigned restart_count = 0;
    int port = 0;
    std::uint64_t generation = 0;
};

/// The supervisor's shared lifecycle record. Every accessor takes the one
/// mutex for the duration of a single read or transition and never blocks
/// while holding it.
///
/// `generation` increases whenever the owned process is attached, released
/// or declared dead, so background tasks started for an older spawn can
/// tell that they have been superseded.
class SupervisorState {
public:
    static constexpr unsigned kDefaultMaxRestartAttempts = 3;

    explicit SupervisorState(int port = 3838,
                             unsigned max_restart_attempts = kDefaultMaxRestartAttempts);
    ~SupervisorState();

    SupervisorState(const SupervisorState&) = delete;
    SupervisorState& operator=(const SupervisorState&) = delete;

    StateSnapshot snapshot() const;
    WorkerStatus status() const;
    unsigned restart_count() const;
    std::uint64_t generation() const;
    bool has_process() const;
    int port() const { return port_; }
    unsigned max_restart_attempts() const { return max_restart_attempts_; }

    /// Stopped/Crashed -> Starting. False if already Starting or Running.
    bool try_begin_start();

    /// Starting -> Crashed after a failed resolve or spawn. False if the
    /// start was already superseded.
    bool abort_start();

    /// An existing listener on the port is taken as our worker. False if
    /// the start was superseded (a stop landed while probing).
    bool mark_adopted();

    /// Store a freshly spawned process and return its generation. Returns 0
    /// and leaves `process` with the caller if the status is no longer
    /// Starting.
    std::uint64_t attach_process(std::unique_ptr<ProcessHandle>& process);

    /// Take the process out for a manual stop
    std::unique_ptr<ProcessHandle> release_process();

    /// Stopped with a clean restart budget
    void mark_stopped();

    struct CrashOutcome {
        bool applied = false;                   // false: superseded, nothing changed
        std::unique_ptr<ProcessHandle> process; // released handle, may be null
        std::uint64_t generation = 0;           // generation after the transition
        std::optional<unsigned> attempt;        // restart attempt (1-based), none once spent
    };

    /// Process of `generation` exited: Crashed, handle cleared, and one
    /// automatic restart counted in the same step
    CrashOutcome mark_exited(std::uint64_t generation);

    /// Failed periodic probe: Crashed and handle cleared, only if Running
    CrashOutcome mark_unhealthy();

    /// Grace period elapsed for `generation`: Running, and a clean restart
    /// budget if the worker answered its probe. False if superseded.
    bool confirm_running(std::uint64_t generation, bool healthy);

private:
    mutable std::mutex mutex_;
    WorkerStatus status_ = WorkerStatus::Stopped;
    std::unique_ptr<ProcessHandle> process_;
    unsigned restart_count_ = 0;
    std::uint64_t generation_ = 0;
    const int port_;
    const unsigned max_restart_attempts_;
};
