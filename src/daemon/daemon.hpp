#pragma once

#include "core/config.hpp"
#include "supervisor/lifecycle_controller.hpp"
#include "supervisor/notification_channel.hpp"
#include "supervisor/supervisor_state.hpp"
#include "supervisor/task_group.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class Daemon {
public:
    using Observer = std::function<void(StatusNotice)>;

    explicit Daemon(Config& config);
    ~Daemon();

    /// Main loop — blocks until stop is requested
    int run();

    /// Request graceful stop (called from signal handler)
    void request_stop();

    /// Called from the event consumer for every published status change
    void add_observer(Observer observer);

    /// Last status announced on the channel ("none" before the first)
    std::string last_event() const;

    LifecycleController& controller() { return controller_; }
    const SupervisorState& state() const { return state_; }

    std::string socket_path() const;

private:
    Config& config_;
    SupervisorState state_;
    NotificationChannel channel_;
    TaskGroup tasks_;
    LifecycleController controller_;

    std::atomic<bool> stop_flag_{false};
    int socket_fd_ = -1;

    // Serializes restart-needed handling against shutdown
    std::mutex lifecycle_mutex_;
    bool shut_down_ = false;

    mutable std::mutex observers_mutex_;
    std::vector<Observer> observers_;
    std::string last_event_ = "none";

    // IPC
    bool start_ipc_server();
    void ipc_loop();
    std::string handle_command(const std::string& json_line);
    void cleanup_socket();

    // Notification consumer
    std::thread event_thread_;
    void event_loop();
    void dispatch_status(StatusNotice notice);
    void handle_restart_needed();

    // Periodic health check
    void health_loop();

    void shutdown();
};
