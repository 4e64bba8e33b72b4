#pragma once

#include <string>

struct WorkerSettings {
    std::string host = "localhost";
    int port = 3838;

    // Locator inputs
    std::string resource_dir;    // packaged resources (empty = none)
    std::string override_dir;    // explicit worker root (empty = none)
    std::string interpreter = "node";
    std::string runtime_name = "node";
    std::string bundle_marker = "engram-bundle.cjs";
    std::string entry_script = "bin/engram.js";
};

struct SupervisorSettings {
    int max_restart_attempts = 3;
    int grace_period_ms = 5000;
    int backoff_unit_ms = 1000;
    int restart_cooldown_ms = 1000;
    int adopt_probe_timeout_ms = 500;
    int health_initial_delay_ms = 10000;
    int health_interval_ms = 30000;
    int health_timeout_ms = 5000;
    int status_timeout_ms = 3000;
    int kill_grace_ms = 5000;        // SIGTERM to SIGKILL
};

struct LogSettings {
    std::string level = "info";
    std::string file;            // rotating log file (empty = console only)
};

struct AppConfig {
    WorkerSettings worker;
    SupervisorSettings supervisor;
    LogSettings log;

    // IPC socket (empty = <config_dir>/sidekeep.sock)
    std::string socket_path;
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool load_from(const std::string& path);
    bool save();
    bool save_to(const std::string& path) const;

    AppConfig& data();
    const AppConfig& data() const;

    /// Configured IPC socket, or <config_dir>/sidekeep.sock
    std::string socket_path() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
