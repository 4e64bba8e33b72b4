#pragma once

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -2 for `run` (caller starts the daemon).
    static int run(int argc, char* argv[]);

    /// "1h 2m 3s", "4m 0s", "5s"
    static std::string format_uptime(unsigned long long seconds);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status();
    static int cmd_start();
    static int cmd_stop();
    static int cmd_restart();
    static int cmd_health();
    static int cmd_locate();
};
