#include "daemon/daemon.hpp"
#include "supervisor/executable_locator.hpp"
#include "core/logging.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <poll.h>
#include <algorithm>
#include <filesystem>
#include <chrono>
#include <cstring>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

CommandResolver make_resolver(const WorkerSettings& settings) {
    return [settings]() {
        ExecutableLocator locator(LocatorEnvironment::from_process(settings));
        return locator.locate();
    };
}

json result_json(const LifecycleController::CommandResult& result) {
    if (result.success) {
        return json({{"ok", true}});
    }
    return json({{"ok", false}, {"error", result.error}});
}

} // namespace

Daemon::Daemon(Config& config)
    : config_(config),
      state_(config.data().worker.port,
             static_cast<unsigned>(std::max(0, config.data().supervisor.max_restart_attempts))),
      controller_(state_, channel_, tasks_,
                  make_resolver(config.data().worker),
                  SupervisorOptions::from_config(config.data())) {}

Daemon::~Daemon() {
    request_stop();
    shutdown();
    cleanup_socket();
}

std::string Daemon::socket_path() const {
    return config_.socket_path();
}

void Daemon::cleanup_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        std::string path = socket_path();
        if (!path.empty()) {
            unlink(path.c_str());
        }
    }
}

bool Daemon::start_ipc_server() {
    auto log = daemon_logger();
    std::string path = socket_path();
    if (path.empty()) {
        log->error("No IPC socket path (HOME is not set)");
        return false;
    }

    // Clean up any existing socket
    unlink(path.c_str());

    // Ensure directory exists
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        log->error("Cannot create {}: {}", fs::path(path).parent_path().string(), ec.message());
        return false;
    }

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (socket_fd_ < 0) {
        log->error("socket() failed: {}", std::strerror(errno));
        return false;
    }

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        log->error("Cannot bind {}: {}", path, std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    // Restrict permissions to owner only
    chmod(path.c_str(), 0600);

    if (listen(socket_fd_, 5) < 0) {
        log->error("listen() failed: {}", std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        unlink(path.c_str());
        return false;
    }

    log->info("Listening on {}", path);
    return true;
}

void Daemon::ipc_loop() {
    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;

    while (!stop_flag_.load()) {
        int ret = poll(&pfd, 1, 500); // 500ms timeout
        if (ret <= 0) continue;

        if (pfd.revents & POLLIN) {
            int client_fd = accept(socket_fd_, nullptr, nullptr);
            if (client_fd < 0) continue;

            // Read a single JSON line
            std::string buffer;
            char c;
            while (read(client_fd, &c, 1) == 1) {
                if (c == '\n') break;
                buffer += c;
                if (buffer.size() > 65536) break; // prevent abuse
            }

            if (!buffer.empty()) {
                std::string response = handle_command(buffer);
                response += "\n";
                ssize_t total = 0;
                while (total < (ssize_t)response.size()) {
                    ssize_t n = write(client_fd, response.data() + total,
                                      response.size() - total);
                    if (n <= 0) {
                        daemon_logger()->debug("Client went away before the reply was sent");
                        break;
                    }
                    total += n;
                }
            }

            close(client_fd);
        }
    }
}

std::string Daemon::handle_command(const std::string& json_line) {
    auto req = json::parse(json_line, nullptr, false);
    if (req.is_discarded() || !req.is_object()) {
        return json({{"ok", false}, {"error", "Parse error: request is not a JSON object"}}).dump();
    }

    std::string cmd = req.value("cmd", "");
    daemon_logger()->debug("IPC command '{}'", cmd);

    if (cmd == "status") {
        auto report = controller_.get_status();
        auto snap = state_.snapshot();
        json data;
        data["running"] = report.running;
        data["status"] = report.status;
        data["lifecycle"] = to_string(snap.status);
        data["port"] = report.port;
        data["worker_reported_count"] = report.worker_reported_count;
        data["uptime"] = report.uptime ? json(*report.uptime) : json(nullptr);
        data["version"] = report.version;
        data["restart_count"] = report.restart_count;
        data["pid"] = snap.pid;
        data["last_event"] = last_event();
        return json({{"ok", true}, {"data", data}}).dump();
    }

    if (cmd == "start") {
        return result_json(controller_.start()).dump();
    }

    if (cmd == "stop") {
        return result_json(controller_.stop()).dump();
    }

    if (cmd == "restart") {
        return result_json(controller_.restart()).dump();
    }

    if (cmd == "health") {
        json data;
        data["healthy"] = controller_.check_health();
        return json({{"ok", true}, {"data", data}}).dump();
    }

    return json({{"ok", false}, {"error", "Unknown command: " + cmd}}).dump();
}

// ── Notification consumer ───────────────────────────────────

void Daemon::add_observer(Observer observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.push_back(std::move(observer));
}

std::string Daemon::last_event() const {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    return last_event_;
}

void Daemon::event_loop() {
    LifecycleEvent event;
    while (true) {
        if (!channel_.pop(event, std::chrono::milliseconds(200))) {
            // Closed and fully drained
            if (channel_.closed() && channel_.size() == 0) return;
            continue;
        }

        daemon_logger()->debug("Event {}", describe(event));
        if (const auto* changed = std::get_if<StatusChanged>(&event)) {
            dispatch_status(changed->status);
        } else {
            handle_restart_needed();
        }
    }
}

void Daemon::dispatch_status(StatusNotice notice) {
    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        last_event_ = to_string(notice);
        observers = observers_;
    }
    for (const auto& observer : observers) {
        try {
            observer(notice);
        } catch (const std::exception& e) {
            daemon_logger()->error("Status observer failed: {}", e.what());
        }
    }
}

void Daemon::handle_restart_needed() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_) return;

    auto result = controller_.start();
    if (!result.success) {
        daemon_logger()->error("Automatic restart failed: {}", result.error);
    }
}

// ── Health loop ─────────────────────────────────────────────

void Daemon::health_loop() {
    const auto& sup = config_.data().supervisor;
    if (!tasks_.sleep_for(std::chrono::milliseconds(sup.health_initial_delay_ms))) return;

    while (true) {
        if (state_.status() == WorkerStatus::Running && !controller_.check_health()) {
            controller_.declare_unhealthy();
        }
        if (!tasks_.sleep_for(std::chrono::milliseconds(sup.health_interval_ms))) return;
    }
}

// ── Lifecycle ───────────────────────────────────────────────

void Daemon::request_stop() {
    stop_flag_.store(true);
}

void Daemon::shutdown() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (shut_down_) return;
        shut_down_ = true;

        auto result = controller_.stop();
        if (!result.success) {
            daemon_logger()->error("Stopping worker on shutdown: {}", result.error);
        }
    }

    channel_.close();
    if (event_thread_.joinable()) {
        event_thread_.join();
    }
    tasks_.cancel();
    tasks_.join();
}

int Daemon::run() {
    auto log = daemon_logger();

    // 1. Start IPC server
    if (!start_ipc_server()) {
        return 1;
    }

    // 2. Notification consumer and health loop
    event_thread_ = std::thread(&Daemon::event_loop, this);
    tasks_.spawn("health", [this]() { health_loop(); });

    // 3. Start the worker; failures are reported and the daemon keeps serving
    auto started = controller_.start();
    if (!started.success) {
        log->error("Worker did not start: {}", started.error);
    }

    // 4. IPC main loop
    ipc_loop();

    // 5. Cleanup
    log->info("Shutting down");
    shutdown();
    cleanup_socket();

    return 0;
}
