#include "supervisor/lifecycle_controller.hpp"
#include "supervisor/process_handle.hpp"
#include "api/worker_client.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace {

constexpr int kMonitorPollMs = 200;
constexpr unsigned kMaxBackoffShift = 16;

std::string describe_exit(const ProcessEvent& event) {
    if (event.kind == ProcessEvent::Kind::SpawnFailed) {
        return "failed to launch: " + event.text;
    }
    if (event.signal != 0) {
        return "killed by signal " + std::to_string(event.signal);
    }
    return "exited with code " + std::to_string(event.exit_code);
}

} // namespace

SupervisorOptions SupervisorOptions::from_config(const AppConfig& config) {
    SupervisorOptions opts;
    opts.host = config.worker.host;
    opts.grace_period_ms = config.supervisor.grace_period_ms;
    opts.backoff_unit_ms = config.supervisor.backoff_unit_ms;
    opts.restart_cooldown_ms = config.supervisor.restart_cooldown_ms;
    opts.adopt_probe_timeout_ms = config.supervisor.adopt_probe_timeout_ms;
    opts.health_timeout_ms = config.supervisor.health_timeout_ms;
    opts.status_timeout_ms = config.supervisor.status_timeout_ms;
    opts.kill_grace_ms = config.supervisor.kill_grace_ms;
    return opts;
}

LifecycleController::LifecycleController(SupervisorState& state,
                                         NotificationChannel& channel,
                                         TaskGroup& tasks,
                                         CommandResolver resolver,
                                         SupervisorOptions options)
    : state_(state),
      channel_(channel),
      tasks_(tasks),
      resolver_(std::move(resolver)),
      options_(std::move(options)) {}

// ── start / stop / restart ──────────────────────────────────

LifecycleController::CommandResult LifecycleController::start() {
    auto log = supervisor_logger();

    if (!state_.try_begin_start()) {
        log->debug("Start requested while worker is {}", to_string(state_.status()));
        return {true, ""};
    }

    int port = state_.port();
    if (WorkerClient::port_open(port, options_.adopt_probe_timeout_ms)) {
        if (!state_.mark_adopted()) {
            return {false, "Start was superseded by a stop"};
        }
        log->info("Port {} already has a listener, adopting it as the worker", port);
        publish_status(StatusNotice::Running);
        return {true, ""};
    }

    auto located = resolver_();
    if (!located.success) {
        log->error("Cannot start worker: {}", located.error);
        if (state_.abort_start()) {
            publish_status(StatusNotice::Crashed);
        }
        return {false, located.error};
    }

    log->info("Starting worker ({}): {}", located.source, located.command.to_string());
    auto spawned = spawn_process(located.command);
    if (!spawned.success) {
        log->error("Failed to spawn worker: {}", spawned.error);
        if (state_.abort_start()) {
            publish_status(StatusNotice::Crashed);
        }
        return {false, spawned.error};
    }

    pid_t pid = spawned.handle->pid();
    std::uint64_t generation = state_.attach_process(spawned.handle);
    if (generation == 0) {
        // A stop landed while spawning
        log->info("Start of worker (pid {}) superseded, discarding it", pid);
        auto killed = spawned.handle->kill(options_.kill_grace_ms);
        if (!killed.success) {
            log->error("Failed to discard worker: {}", killed.error);
        }
        return {false, "Start was superseded by a stop"};
    }
    publish_status(StatusNotice::Starting);

    std::shared_ptr<ProcessOutput> output(std::move(spawned.output));
    bool monitored = tasks_.spawn("monitor", [this, output, generation, pid]() {
        monitor_output(output, generation, pid);
    });
    bool confirming = tasks_.spawn("grace", [this, generation]() {
        confirm_after_grace(generation);
    });
    if (!monitored || !confirming) {
        log->warn("Supervisor is shutting down, worker (pid {}) will not be monitored", pid);
    }

    return {true, ""};
}

LifecycleController::CommandResult LifecycleController::stop() {
    auto log = supervisor_logger();
    CommandResult result{true, ""};

    auto process = state_.release_process();
    if (process) {
        pid_t pid = process->pid();
        log->info("Stopping worker (pid {})", pid);
        auto killed = process->kill(options_.kill_grace_ms);
        if (!killed.success) {
            log->error("Failed to stop worker: {}", killed.error);
            result = {false, killed.error};
        }
    }

    state_.mark_stopped();
    publish_status(StatusNotice::Stopped);
    return result;
}

LifecycleController::CommandResult LifecycleController::restart() {
    auto stopped = stop();
    if (!stopped.success) {
        return stopped;
    }
    if (!tasks_.sleep_for(std::chrono::milliseconds(options_.restart_cooldown_ms))) {
        return {false, "Supervisor is shutting down"};
    }
    return start();
}

// ── Health and status ───────────────────────────────────────

bool LifecycleController::check_health() {
    WorkerClient client(options_.host, state_.port());
    return client.probe(options_.health_timeout_ms);
}

WorkerStatusReport LifecycleController::get_status() {
    auto snap = state_.snapshot();

    WorkerStatusReport report;
    report.port = snap.port;
    report.restart_count = snap.restart_count;
    report.running = snap.status == WorkerStatus::Running;
    report.status = to_string(snap.status);

    if (report.running) {
        WorkerClient client(options_.host, snap.port);
        auto info = client.fetch_status(options_.status_timeout_ms);
        if (info) {
            report.status = info->status.value_or("running");
            report.worker_reported_count = info->memories.value_or(0);
            report.uptime = info->uptime;
            report.version = info->version.value_or("unknown");
        }
    }
    return report;
}

bool LifecycleController::declare_unhealthy() {
    auto outcome = state_.mark_unhealthy();
    if (!outcome.applied) return false;

    supervisor_logger()->warn("Worker failed its health check, scheduling restart");
    // Take the child down; its monitor is superseded
    if (outcome.process) {
        auto killed = outcome.process->kill(options_.kill_grace_ms);
        if (!killed.success) {
            supervisor_logger()->error("Failed to stop unhealthy worker: {}", killed.error);
        }
        outcome.process.reset();
    }
    publish_restart();
    return true;
}

std::chrono::milliseconds LifecycleController::backoff_delay(unsigned attempt) const {
    // Past 2^kMaxBackoffShift units the wait stops growing
    unsigned shift = std::min(attempt, kMaxBackoffShift);
    long long unit = std::max(0, options_.backoff_unit_ms);
    return std::chrono::milliseconds(unit << shift);
}

// ── Background tasks ────────────────────────────────────────

void LifecycleController::monitor_output(std::shared_ptr<ProcessOutput> output,
                                         std::uint64_t generation, pid_t pid) {
    auto log = worker_logger();
    ProcessEvent event;

    while (!output->exhausted()) {
        if (!output->next_event(event, kMonitorPollMs)) {
            if (tasks_.cancelled()) return;
            continue;
        }

        switch (event.kind) {
            case ProcessEvent::Kind::StdoutLine:
                log->info("{}", event.text);
                break;
            case ProcessEvent::Kind::StderrLine:
                log->warn("{}", event.text);
                break;
            case ProcessEvent::Kind::Terminated:
            case ProcessEvent::Kind::SpawnFailed:
                handle_exit(event, generation, pid);
                return;
        }
    }
}

void LifecycleController::handle_exit(const ProcessEvent& event, std::uint64_t generation, pid_t pid) {
    auto log = supervisor_logger();

    auto outcome = state_.mark_exited(generation);
    if (!outcome.applied) {
        log->info("Worker (pid {}) {} after it was replaced", pid, describe_exit(event));
        return;
    }
    log->warn("Worker (pid {}) {}", pid, describe_exit(event));
    outcome.process.reset();
    publish_status(StatusNotice::Crashed);

    auto attempt = outcome.attempt;
    if (!attempt) {
        log->error("Worker crashed {} times in a row, giving up until started manually",
                   state_.max_restart_attempts());
        publish_status(StatusNotice::Failed);
        return;
    }

    if (event.kind == ProcessEvent::Kind::Terminated) {
        auto delay = backoff_delay(*attempt);
        log->info("Restarting worker in {} ms (attempt {}/{})",
                  delay.count(), *attempt, state_.max_restart_attempts());
        if (!tasks_.sleep_for(delay)) return;

        // A manual stop or start during the wait takes precedence
        if (state_.generation() != outcome.generation) {
            log->info("Worker state changed during backoff, skipping restart");
            return;
        }
    } else {
        log->info("Retrying worker launch (attempt {}/{})", *attempt, state_.max_restart_attempts());
    }

    publish_restart();
}

void LifecycleController::confirm_after_grace(std::uint64_t generation) {
    if (!tasks_.sleep_for(std::chrono::milliseconds(options_.grace_period_ms))) return;
    if (state_.generation() != generation) return;

    bool healthy = check_health();
    if (!state_.confirm_running(generation, healthy)) return;

    if (healthy) {
        supervisor_logger()->info("Worker started successfully on port {}", state_.port());
    } else {
        supervisor_logger()->info("Worker started on port {}, health check pending", state_.port());
    }
    publish_status(StatusNotice::Running);
}

// ── Notifications ───────────────────────────────────────────

void LifecycleController::publish_status(StatusNotice notice) {
    if (!channel_.try_push(StatusChanged{notice})) {
        supervisor_logger()->warn("Notification channel full, dropped status '{}'", to_string(notice));
    }
}

void LifecycleController::publish_restart() {
    if (!channel_.push(RestartNeeded{})) {
        supervisor_logger()->debug("Notification channel closed, restart not requested");
    }
}
