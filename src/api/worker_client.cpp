#include "api/worker_client.hpp"
#include "core/logging.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

using json = nlohmann::json;

namespace {

constexpr const char* kStatusPath = "/api/status";

// Non-negative JSON number as an integer; fractional values are truncated
std::optional<std::uint64_t> as_count(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_number_integer()) {
        auto v = value.get<std::int64_t>();
        if (v >= 0) return static_cast<std::uint64_t>(v);
    }
    if (value.is_number_float()) {
        // 2^64 is exact as a double; anything at or above it does not fit
        auto v = value.get<double>();
        if (v >= 0 && v < 18446744073709551616.0) return static_cast<std::uint64_t>(v);
    }
    return std::nullopt;
}

} // namespace

struct WorkerClient::Impl {
    std::string host;
    int port;

    std::unique_ptr<httplib::Client> make_client(int timeout_ms) {
        auto cli = std::make_unique<httplib::Client>(host, port);
        time_t sec = timeout_ms / 1000;
        time_t usec = (timeout_ms % 1000) * 1000;
        cli->set_connection_timeout(sec, usec);
        cli->set_read_timeout(sec, usec);
        cli->set_write_timeout(sec, usec);
        return cli;
    }
};

WorkerClient::WorkerClient(const std::string& host, int port)
    : impl_(std::make_unique<Impl>()) {
    impl_->host = host;
    impl_->port = port;
}

WorkerClient::~WorkerClient() = default;

// ── Health probe ────────────────────────────────────────────

bool WorkerClient::probe(int timeout_ms) {
    try {
        auto cli = impl_->make_client(timeout_ms);
        auto res = cli->Get(kStatusPath);
        if (!res) {
            supervisor_logger()->debug("Probe of {}:{} failed: {}", impl_->host, impl_->port,
                                       httplib::to_string(res.error()));
            return false;
        }
        return res->status >= 200 && res->status < 300;
    } catch (const std::exception& e) {
        supervisor_logger()->debug("Probe of {}:{} failed: {}", impl_->host, impl_->port, e.what());
        return false;
    }
}

// ── Status ──────────────────────────────────────────────────

std::optional<WorkerStatusInfo> WorkerClient::fetch_status(int timeout_ms) {
    try {
        auto cli = impl_->make_client(timeout_ms);
        auto res = cli->Get(kStatusPath);
        if (!res || res->status < 200 || res->status >= 300) {
            return std::nullopt;
        }
        return parse_status(res->body);
    } catch (const std::exception& e) {
        supervisor_logger()->debug("Status query failed: {}", e.what());
        return std::nullopt;
    }
}

std::optional<WorkerStatusInfo> WorkerClient::parse_status(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    WorkerStatusInfo info;
    if (j.contains("status") && j["status"].is_string()) {
        info.status = j["status"].get<std::string>();
    }
    if (j.contains("memories")) {
        info.memories = as_count(j["memories"]);
    } else if (j.contains("memory") && j["memory"].is_object() && j["memory"].contains("total")) {
        // Older workers nest the count
        info.memories = as_count(j["memory"]["total"]);
    }
    if (j.contains("uptime")) {
        info.uptime = as_count(j["uptime"]);
    }
    if (j.contains("version") && j["version"].is_string()) {
        info.version = j["version"].get<std::string>();
    }
    return info;
}

// ── Port check ──────────────────────────────────────────────

bool WorkerClient::port_open(int port, int timeout_ms) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return false;

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    bool open = false;
    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) == 0) {
        open = true;
    } else if (errno == EINPROGRESS) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        if (poll(&pfd, 1, timeout_ms) > 0) {
            int err = 0;
            socklen_t len = sizeof(err);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0) {
                open = true;
            }
        }
    }

    close(fd);
    return open;
}
