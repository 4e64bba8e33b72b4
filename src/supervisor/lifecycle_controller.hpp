#pragma once

#include "supervisor/executable_locator.hpp"
#include "supervisor/notification_channel.hpp"
#include "supervisor/supervisor_state.hpp"
#include "supervisor/task_group.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

struct AppConfig;
class ProcessOutput;
struct ProcessEvent;

/// Timings and endpoint the controller works with (milliseconds)
struct SupervisorOptions {
    std::string host = "localhost";
    int grace_period_ms = 5000;
    int backoff_unit_ms = 1000;
    int restart_cooldown_ms = 1000;
    int adopt_probe_timeout_ms = 500;
    int health_timeout_ms = 5000;
    int status_timeout_ms = 3000;
    int kill_grace_ms = 5000;

    static SupervisorOptions from_config(const AppConfig& config);
};

struct WorkerStatusReport {
    bool running = false;
    std::string status = "stopped";
    int port = 0;
    std::uint64_t worker_reported_count = 0;
    std::optional<std::uint64_t> uptime;    // seconds
    std::string version = "unknown";
    unsigned restart_count = 0;
};

/// Produces the worker command line for each start attempt
using CommandResolver = std::function<LocateResult()>;

/// The worker state machine. Owns every transition of SupervisorState and
/// reports them on the notification channel; background work runs in the
/// task group so shutdown can cancel it.
class LifecycleController {
public:
    LifecycleController(SupervisorState& state,
                        NotificationChannel& channel,
                        TaskGroup& tasks,
                        CommandResolver resolver,
                        SupervisorOptions options = {});

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    struct CommandResult {
        bool success;
        std::string error;
    };

    /// Adopt a listener already on the port, or spawn the worker. Returns
    /// once the process is launched; readiness is confirmed in the background.
    CommandResult start();

    /// Kill the owned worker (if any) and reset to Stopped
    CommandResult stop();

    /// stop(), cooldown, start()
    CommandResult restart();

    /// One probe of the status endpoint
    bool check_health();

    /// Live numbers from the worker while Running, lifecycle state otherwise
    WorkerStatusReport get_status();

    /// Periodic check failed: Crashed, handle released, restart requested.
    /// False (and nothing changes) unless the worker was Running.
    bool declare_unhealthy();

    /// Wait before automatic restart `attempt` (1-based): unit * 2^attempt
    std::chrono::milliseconds backoff_delay(unsigned attempt) const;

    const SupervisorOptions& options() const { return options_; }

private:
    SupervisorState& state_;
    NotificationChannel& channel_;
    TaskGroup& tasks_;
    CommandResolver resolver_;
    SupervisorOptions options_;

    void monitor_output(std::shared_ptr<ProcessOutput> output, std::uint64_t generation, pid_t pid);
    void handle_exit(const ProcessEvent& event, std::uint64_t generation, pid_t pid);
    void confirm_after_grace(std::uint64_t generation);

    void publish_status(StatusNotice notice);
    void publish_restart();
};
