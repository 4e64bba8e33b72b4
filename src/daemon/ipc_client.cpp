#include "daemon/ipc_client.hpp"
#include "core/config.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

using json = nlohmann::json;

DaemonClient::DaemonClient(std::string socket_path) : socket_path_(std::move(socket_path)) {
    if (socket_path_.empty()) {
        Config config;
        config.load();
        socket_path_ = config.socket_path();
    }
}

json DaemonClient::send_command(const json& cmd) {
    if (socket_path_.empty()) return json();

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return json();

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return json();
    }

    // Set read timeout; stop and restart may wait out a slow worker
    struct timeval tv;
    tv.tv_sec = 30;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Send command
    std::string msg = cmd.dump() + "\n";
    ssize_t total = 0;
    while (total < (ssize_t)msg.size()) {
        ssize_t n = write(fd, msg.data() + total, msg.size() - total);
        if (n <= 0) {
            close(fd);
            return json();
        }
        total += n;
    }

    // Read response
    std::string buffer;
    char c;
    while (read(fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 65536) break;
    }

    close(fd);

    if (buffer.empty()) return json();

    auto resp = json::parse(buffer, nullptr, false);
    if (resp.is_discarded() || !resp.is_object()) return json();
    return resp;
}

bool DaemonClient::simple_command(const std::string& name, std::string& err) {
    auto resp = send_command({{"cmd", name}});
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return false;
    }
    if (resp.value("ok", false)) return true;
    err = resp.value("error", "Unknown error");
    return false;
}

bool DaemonClient::is_daemon_running() {
    auto resp = send_command({{"cmd", "status"}});
    return !resp.empty() && resp.value("ok", false);
}

DaemonClient::DaemonStatus DaemonClient::get_status() {
    DaemonStatus status;
    auto resp = send_command({{"cmd", "status"}});
    if (resp.empty() || !resp.value("ok", false)) return status;

    auto it = resp.find("data");
    if (it == resp.end() || !it->is_object()) return status;
    const auto& data = *it;

    status.reachable = true;
    status.running = data.value("running", false);
    status.status = data.value("status", "");
    status.lifecycle = data.value("lifecycle", "");
    status.port = data.value("port", 0);
    status.worker_reported_count = data.value("worker_reported_count", std::uint64_t{0});
    auto uptime = data.find("uptime");
    if (uptime != data.end() && uptime->is_number_unsigned()) {
        status.uptime = uptime->get<std::uint64_t>();
    }
    status.version = data.value("version", "unknown");
    status.restart_count = data.value("restart_count", 0u);
    status.pid = data.value("pid", -1);
    status.last_event = data.value("last_event", "");
    return status;
}

bool DaemonClient::start(std::string& err) {
    return simple_command("start", err);
}

bool DaemonClient::stop(std::string& err) {
    return simple_command("stop", err);
}

bool DaemonClient::restart(std::string& err) {
    return simple_command("restart", err);
}

bool DaemonClient::health(bool& healthy, std::string& err) {
    auto resp = send_command({{"cmd", "health"}});
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return false;
    }
    if (!resp.value("ok", false)) {
        err = resp.value("error", "Unknown error");
        return false;
    }
    auto it = resp.find("data");
    healthy = it != resp.end() && it->is_object() && it->value("healthy", false);
    return true;
}
