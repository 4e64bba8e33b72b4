#include "core/cli.hpp"
#include "core/config.hpp"
#include "daemon/ipc_client.hpp"
#include "supervisor/executable_locator.hpp"

#include <cstring>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return 1;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "run") == 0) {
        return -2;  // special: caller handles daemon mode
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }
    if (std::strcmp(cmd, "start") == 0) {
        return cmd_start();
    }
    if (std::strcmp(cmd, "stop") == 0) {
        return cmd_stop();
    }
    if (std::strcmp(cmd, "restart") == 0) {
        return cmd_restart();
    }
    if (std::strcmp(cmd, "health") == 0) {
        return cmd_health();
    }
    if (std::strcmp(cmd, "locate") == 0) {
        return cmd_locate();
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'sidekeep help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "sidekeep — supervisor for a local worker process\n"
        "\n"
        "Usage:\n"
        "  sidekeep run        Run the supervisor in the foreground\n"
        "  sidekeep status     Show worker status\n"
        "  sidekeep start      Start the worker\n"
        "  sidekeep stop       Stop the worker\n"
        "  sidekeep restart    Stop, then start the worker\n"
        "  sidekeep health     Probe the worker's status endpoint\n"
        "  sidekeep locate     Print the command line the worker would run with\n"
        "  sidekeep version    Show version\n"
        "  sidekeep help       Show this help\n"
        "\n"
        "Configuration: " << Config::config_path() << "\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "sidekeep " << APP_VERSION << "\n";
    return 0;
}

// ── status ──────────────────────────────────────────────────

std::string CLI::format_uptime(unsigned long long seconds) {
    unsigned long long h = seconds / 3600;
    unsigned long long m = (seconds % 3600) / 60;
    unsigned long long s = seconds % 60;
    std::string out;
    if (h > 0) out += std::to_string(h) + "h ";
    if (h > 0 || m > 0) out += std::to_string(m) + "m ";
    out += std::to_string(s) + "s";
    return out;
}

int CLI::cmd_status() {
    DaemonClient dc;
    auto st = dc.get_status();
    if (!st.reachable) {
        std::cout << "Daemon:  stopped\n";
        return 1;
    }

    std::cout << "Daemon:  running\n";
    std::cout << "Worker:  " << st.lifecycle;
    if (st.pid > 0) std::cout << " (pid " << st.pid << ")";
    std::cout << "\n";
    if (st.running) {
        std::cout << "Status:  " << st.status << "\n";
        std::cout << "Version: " << st.version << "\n";
        std::cout << "Count:   " << st.worker_reported_count << "\n";
        if (st.uptime) {
            std::cout << "Uptime:  " << format_uptime(*st.uptime) << "\n";
        }
    }
    std::cout << "Port:    " << st.port << "\n";
    std::cout << "Restarts: " << st.restart_count << "\n";
    if (!st.last_event.empty()) {
        std::cout << "Event:   " << st.last_event << "\n";
    }
    return 0;
}

// ── start / stop / restart ──────────────────────────────────

int CLI::cmd_start() {
    DaemonClient dc;
    std::string err;
    if (!dc.start(err)) {
        std::cerr << "Start failed: " << err << "\n";
        return 1;
    }
    std::cout << "Worker starting\n";
    return 0;
}

int CLI::cmd_stop() {
    DaemonClient dc;
    std::string err;
    if (!dc.stop(err)) {
        std::cerr << "Stop failed: " << err << "\n";
        return 1;
    }
    std::cout << "Worker stopped\n";
    return 0;
}

int CLI::cmd_restart() {
    DaemonClient dc;
    std::string err;
    if (!dc.restart(err)) {
        std::cerr << "Restart failed: " << err << "\n";
        return 1;
    }
    std::cout << "Worker restarting\n";
    return 0;
}

// ── health ──────────────────────────────────────────────────

int CLI::cmd_health() {
    DaemonClient dc;
    bool healthy = false;
    std::string err;
    if (!dc.health(healthy, err)) {
        std::cerr << "Health check failed: " << err << "\n";
        return 1;
    }
    std::cout << (healthy ? "healthy" : "unhealthy") << "\n";
    return healthy ? 0 : 1;
}

// ── locate ──────────────────────────────────────────────────

int CLI::cmd_locate() {
    Config config;
    config.load();

    ExecutableLocator locator(LocatorEnvironment::from_process(config.data().worker));
    auto result = locator.locate();
    if (!result.success) {
        std::cerr << result.error << "\n";
        return 1;
    }

    std::cout << "Source:  " << result.source << "\n";
    std::cout << "Command: " << result.command.to_string() << "\n";
    for (const auto& [key, value] : result.command.env) {
        std::cout << "Env:     " << key << "=" << value << "\n";
    }
    return 0;
}
