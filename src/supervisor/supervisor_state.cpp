#include "supervisor/supervisor_state.hpp"
#include "supervisor/process_handle.hpp"

const char* to_string(WorkerStatus status) {
    switch (status) {
        case WorkerStatus::Stopped:  return "stopped";
        case WorkerStatus::Starting: return "starting";
        case WorkerStatus::Running:  return "running";
        case WorkerStatus::Crashed:  return "crashed";
    }
    return "unknown";
}

SupervisorState::SupervisorState(int port, unsigned max_restart_attempts)
    : port_(port), max_restart_attempts_(max_restart_attempts) {}

// Out of line: ProcessHandle is incomplete in the header
SupervisorState::~SupervisorState() = default;

StateSnapshot SupervisorState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StateSnapshot snap;
    snap.status = status_;
    snap.has_process = process_ != nullptr;
    snap.pid = process_ ? process_->pid() : -1;
    snap.restart_count = restart_count_;
    snap.port = port_;
    snap.generation = generation_;
    return snap;
}

WorkerStatus SupervisorState::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

unsigned SupervisorState::restart_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return restart_count_;
}

std::uint64_t SupervisorState::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

bool SupervisorState::has_process() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ != nullptr;
}

bool SupervisorState::try_begin_start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == WorkerStatus::Running || status_ == WorkerStatus::Starting) {
        return false;
    }
    status_ = WorkerStatus::Starting;
    return true;
}

bool SupervisorState::abort_start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != WorkerStatus::Starting) return false;
    status_ = WorkerStatus::Crashed;
    return true;
}

bool SupervisorState::mark_adopted() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != WorkerStatus::Starting) return false;
    status_ = WorkerStatus::Running;
    restart_count_ = 0;
    return true;
}

std::uint64_t SupervisorState::attach_process(std::unique_ptr<ProcessHandle>& process) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != WorkerStatus::Starting || process_) return 0;
    process_ = std::move(process);
    return ++generation_;
}

std::unique_ptr<ProcessHandle> SupervisorState::release_process() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    return std::move(process_);
}

void SupervisorState::mark_stopped() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = WorkerStatus::Stopped;
    restart_count_ = 0;
}

SupervisorState::CrashOutcome SupervisorState::mark_exited(std::uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    CrashOutcome outcome;
    if (generation != generation_) {
        outcome.generation = generation_;
        return outcome;
    }
    status_ = WorkerStatus::Crashed;
    outcome.applied = true;
    outcome.process = std::move(process_);
    outcome.generation = ++generation_;
    if (restart_count_ < max_restart_attempts_) {
        outcome.attempt = ++restart_count_;
    }
    return outcome;
}

SupervisorState::CrashOutcome SupervisorState::mark_unhealthy() {
    std::lock_guard<std::mutex> lock(mutex_);
    CrashOutcome outcome;
    if (status_ != WorkerStatus::Running) {
        outcome.generation = generation_;
        return outcome;
    }
    status_ = WorkerStatus::Crashed;
    outcome.applied = true;
    outcome.process = std::move(process_);
    outcome.generation = ++generation_;
    return outcome;
}

bool SupervisorState::confirm_running(std::uint64_t generation, bool healthy) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) return false;
    if (status_ != WorkerStatus::Starting && status_ != WorkerStatus::Running) return false;
    status_ = WorkerStatus::Running;
    if (healthy) {
        restart_count_ = 0;
    }
    return true;
}
