#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>

class DaemonClient {
public:
    /// Talk to the daemon at socket_path; empty means the configured default
    explicit DaemonClient(std::string socket_path = "");

    /// Check if the daemon is running (socket exists and responds)
    bool is_daemon_running();

    struct DaemonStatus {
        bool reachable = false;
        bool running = false;
        std::string status;
        std::string lifecycle;
        int port = 0;
        std::uint64_t worker_reported_count = 0;
        std::optional<std::uint64_t> uptime;
        std::string version;
        unsigned restart_count = 0;
        int pid = -1;
        std::string last_event;
    };

    /// Get worker status as the daemon sees it
    DaemonStatus get_status();

    /// Request worker start/stop/restart
    bool start(std::string& err);
    bool stop(std::string& err);
    bool restart(std::string& err);

    /// Ask the daemon to probe the worker once
    bool health(bool& healthy, std::string& err);

    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;

    /// Send a JSON command and receive response
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd);

    bool simple_command(const std::string& name, std::string& err);
};
