#include <gtest/gtest.h>
#include "supervisor/lifecycle_controller.hpp"
#include "supervisor/process_handle.hpp"
#include "core/config.hpp"

#include <httplib.h>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

int unused_port() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(fd, (struct sockaddr*)&addr, sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, (struct sockaddr*)&addr, &len);
    close(fd);
    return ntohs(addr.sin_port);
}

// Serves GET /api/status on a fixed loopback port
class FakeWorker {
public:
    FakeWorker(int port, std::string body) : body_(std::move(body)) {
        server_.Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(body_, "application/json");
        });
        bound_ = server_.bind_to_port("127.0.0.1", port);
        if (bound_) {
            thread_ = std::thread([this]() { server_.listen_after_bind(); });
            server_.wait_until_ready();
        }
    }

    ~FakeWorker() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    bool bound() const { return bound_; }

private:
    httplib::Server server_;
    std::thread thread_;
    std::string body_;
    bool bound_ = false;
};

LocateResult shell_worker(const std::string& script) {
    LocateResult result;
    result.success = true;
    result.source = "test";
    result.command.program = "/bin/sh";
    result.command.args = {"-c", script};
    return result;
}

} // namespace

class LifecycleControllerTest : public ::testing::Test {
protected:
    int port = unused_port();
    SupervisorState state{port, 3};
    NotificationChannel channel;
    TaskGroup tasks;
    std::atomic<int> resolves{0};
    LocateResult worker = shell_worker("exec sleep 60");
    std::unique_ptr<LifecycleController> controller;
    std::vector<std::string> seen;

    SupervisorOptions fast_options() {
        SupervisorOptions opts;
        opts.host = "127.0.0.1";
        opts.grace_period_ms = 200;
        opts.backoff_unit_ms = 20;
        opts.restart_cooldown_ms = 20;
        opts.adopt_probe_timeout_ms = 200;
        opts.health_timeout_ms = 500;
        opts.status_timeout_ms = 500;
        opts.kill_grace_ms = 1000;
        return opts;
    }

    void make_controller(SupervisorOptions opts) {
        controller = std::make_unique<LifecycleController>(
            state, channel, tasks,
            [this]() {
                ++resolves;
                return worker;
            },
            opts);
    }

    void SetUp() override {
        make_controller(fast_options());
    }

    void TearDown() override {
        controller->stop();
        channel.close();
        tasks.cancel();
        tasks.join();
    }

    // Pop events until `wanted` shows up; everything popped lands in `seen`
    bool wait_for(const std::string& wanted, std::chrono::milliseconds timeout = 3000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        LifecycleEvent ev;
        while (std::chrono::steady_clock::now() < deadline) {
            if (channel.pop(ev, 20ms)) {
                seen.push_back(describe(ev));
                if (seen.back() == wanted) return true;
            }
        }
        return false;
    }

    // One crash recorded against the budget, outside the controller
    void record_crash() {
        CommandSpec cmd;
        cmd.program = "/bin/sleep";
        cmd.args = {"60"};
        auto spawned = spawn_process(cmd);
        ASSERT_TRUE(spawned.success) << spawned.error;
        ASSERT_TRUE(state.try_begin_start());
        auto outcome = state.mark_exited(state.attach_process(spawned.handle));
        ASSERT_TRUE(outcome.applied);
        outcome.process->kill(1000);
    }

    bool seen_event(const std::string& wanted) const {
        for (const auto& s : seen) {
            if (s == wanted) return true;
        }
        return false;
    }
};

// ── start ───────────────────────────────────────────────────

TEST_F(LifecycleControllerTest, StartSpawnsAndAnnouncesStarting) {
    auto result = controller->start();
    ASSERT_TRUE(result.success) << result.error;

    auto snap = state.snapshot();
    EXPECT_EQ(snap.status, WorkerStatus::Starting);
    EXPECT_TRUE(snap.has_process);
    EXPECT_GT(snap.pid, 0);
    EXPECT_TRUE(wait_for("status-changed:starting"));
}

TEST_F(LifecycleControllerTest, NeverHealthyWorkerIsRunningAfterGrace) {
    ASSERT_TRUE(controller->start().success);
    ASSERT_TRUE(wait_for("status-changed:running"));

    auto snap = state.snapshot();
    EXPECT_EQ(snap.status, WorkerStatus::Running);
    EXPECT_TRUE(snap.has_process);
    EXPECT_EQ(snap.restart_count, 0u);
}

TEST_F(LifecycleControllerTest, HealthyGraceResetsRestartBudget) {
    record_crash();
    ASSERT_EQ(state.restart_count(), 1u);

    auto opts = fast_options();
    opts.grace_period_ms = 500;
    make_controller(opts);

    ASSERT_TRUE(controller->start().success);
    // The status endpoint comes up during the grace period
    FakeWorker endpoint(port, R"({"status":"ok"})");
    ASSERT_TRUE(endpoint.bound());

    ASSERT_TRUE(wait_for("status-changed:running"));
    EXPECT_EQ(state.restart_count(), 0u);
}

TEST_F(LifecycleControllerTest, SecondStartIsNoop) {
    ASSERT_TRUE(controller->start().success);
    pid_t pid = state.snapshot().pid;

    auto again = controller->start();
    EXPECT_TRUE(again.success);
    EXPECT_EQ(state.snapshot().pid, pid);
    EXPECT_EQ(resolves.load(), 1);
}

TEST_F(LifecycleControllerTest, ConcurrentStartsSpawnOnce) {
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (controller->start().success) ++ok;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ok.load(), 8);
    EXPECT_EQ(resolves.load(), 1);
    EXPECT_TRUE(state.has_process());
}

TEST_F(LifecycleControllerTest, AdoptsExistingListener) {
    FakeWorker existing(port, R"({"status":"ok"})");
    ASSERT_TRUE(existing.bound());

    auto result = controller->start();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(resolves.load(), 0);

    auto snap = state.snapshot();
    EXPECT_EQ(snap.status, WorkerStatus::Running);
    EXPECT_FALSE(snap.has_process);
    EXPECT_EQ(snap.restart_count, 0u);
    EXPECT_TRUE(wait_for("status-changed:running"));
}

TEST_F(LifecycleControllerTest, ResolveFailureCrashes) {
    worker = LocateResult{};
    worker.error = "Could not locate the worker";

    auto result = controller->start();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Could not locate the worker");
    EXPECT_EQ(state.status(), WorkerStatus::Crashed);
    EXPECT_FALSE(state.has_process());
    EXPECT_TRUE(wait_for("status-changed:crashed"));
}

// ── stop / restart ──────────────────────────────────────────

TEST_F(LifecycleControllerTest, StopResetsState) {
    record_crash();
    ASSERT_TRUE(controller->start().success);
    ASSERT_EQ(state.restart_count(), 1u);

    auto result = controller->stop();
    EXPECT_TRUE(result.success) << result.error;

    auto status = controller->get_status();
    EXPECT_FALSE(status.running);
    EXPECT_EQ(status.status, "stopped");
    EXPECT_EQ(status.restart_count, 0u);
    EXPECT_EQ(status.version, "unknown");
    EXPECT_FALSE(state.has_process());
    EXPECT_TRUE(wait_for("status-changed:stopped"));
}

TEST_F(LifecycleControllerTest, StopWithoutProcessIsSafe) {
    auto result = controller->stop();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(state.status(), WorkerStatus::Stopped);
}

TEST_F(LifecycleControllerTest, RestartSpawnsNewProcess) {
    ASSERT_TRUE(controller->start().success);
    pid_t first = state.snapshot().pid;

    auto result = controller->restart();
    ASSERT_TRUE(result.success) << result.error;
    pid_t second = state.snapshot().pid;
    EXPECT_GT(second, 0);
    EXPECT_NE(first, second);
    EXPECT_EQ(resolves.load(), 2);
}

// ── Crash recovery ──────────────────────────────────────────

TEST_F(LifecycleControllerTest, BackoffDoublesPerAttempt) {
    auto opts = fast_options();
    opts.backoff_unit_ms = 1000;
    make_controller(opts);
    EXPECT_EQ(controller->backoff_delay(1), 2000ms);
    EXPECT_EQ(controller->backoff_delay(2), 4000ms);
    EXPECT_EQ(controller->backoff_delay(3), 8000ms);
}

TEST_F(LifecycleControllerTest, BackoffStopsGrowingForLargeBudgets) {
    auto opts = fast_options();
    opts.backoff_unit_ms = 1000;
    make_controller(opts);
    auto cap = controller->backoff_delay(16);
    EXPECT_EQ(cap, std::chrono::milliseconds(1000LL << 16));
    EXPECT_EQ(controller->backoff_delay(63), cap);
    EXPECT_EQ(controller->backoff_delay(200), cap);
}

TEST(SupervisorOptionsTest, FollowConfig) {
    AppConfig config;
    config.worker.host = "127.0.0.1";
    config.supervisor.kill_grace_ms = 750;
    config.supervisor.backoff_unit_ms = 40;

    auto opts = SupervisorOptions::from_config(config);
    EXPECT_EQ(opts.host, "127.0.0.1");
    EXPECT_EQ(opts.kill_grace_ms, 750);
    EXPECT_EQ(opts.backoff_unit_ms, 40);
}

TEST_F(LifecycleControllerTest, CrashSchedulesRestartAfterBackoff) {
    auto opts = fast_options();
    opts.backoff_unit_ms = 100;
    make_controller(opts);
    worker = shell_worker("exit 1");

    ASSERT_TRUE(controller->start().success);
    ASSERT_TRUE(wait_for("status-changed:crashed"));
    auto crashed_at = std::chrono::steady_clock::now();

    ASSERT_TRUE(wait_for("restart-needed"));
    EXPECT_GE(std::chrono::steady_clock::now() - crashed_at, 180ms);

    EXPECT_EQ(state.status(), WorkerStatus::Crashed);
    EXPECT_FALSE(state.has_process());
    EXPECT_EQ(state.restart_count(), 1u);
}

TEST_F(LifecycleControllerTest, BudgetExhaustionReportsFailed) {
    worker = shell_worker("exit 1");
    ASSERT_TRUE(controller->start().success);

    // Act as the restart listener
    auto deadline = std::chrono::steady_clock::now() + 10s;
    LifecycleEvent ev;
    bool failed = false;
    while (!failed && std::chrono::steady_clock::now() < deadline) {
        if (!channel.pop(ev, 20ms)) continue;
        seen.push_back(describe(ev));
        if (std::holds_alternative<RestartNeeded>(ev)) {
            controller->start();
        } else if (seen.back() == "status-changed:failed") {
            failed = true;
        }
    }

    ASSERT_TRUE(failed);
    EXPECT_EQ(resolves.load(), 4);   // first start plus three restarts
    EXPECT_EQ(state.restart_count(), 3u);
    EXPECT_EQ(state.status(), WorkerStatus::Crashed);

    // No fourth restart is ever requested
    EXPECT_FALSE(wait_for("restart-needed", 300ms));
    EXPECT_EQ(resolves.load(), 4);

    // A manual start is still allowed
    worker = shell_worker("exec sleep 60");
    EXPECT_TRUE(controller->start().success);
    EXPECT_TRUE(state.has_process());
    // Starting does not touch the budget; a healthy grace probe or stop does
    EXPECT_EQ(state.restart_count(), 3u);
}

TEST_F(LifecycleControllerTest, LaunchFailureRestartsWithoutBackoff) {
    auto opts = fast_options();
    opts.backoff_unit_ms = 60000;
    make_controller(opts);
    worker = LocateResult{};
    worker.success = true;
    worker.command.program = "/nonexistent/sidekeep-worker";

    ASSERT_TRUE(controller->start().success);
    ASSERT_TRUE(wait_for("status-changed:crashed"));
    EXPECT_TRUE(wait_for("restart-needed", 1000ms));
    EXPECT_EQ(state.restart_count(), 1u);
}

TEST_F(LifecycleControllerTest, StopDuringBackoffCancelsRestart) {
    auto opts = fast_options();
    opts.backoff_unit_ms = 200;
    make_controller(opts);
    worker = shell_worker("exit 1");

    ASSERT_TRUE(controller->start().success);
    ASSERT_TRUE(wait_for("status-changed:crashed"));
    ASSERT_TRUE(controller->stop().success);

    EXPECT_FALSE(wait_for("restart-needed", 800ms));
    EXPECT_EQ(state.status(), WorkerStatus::Stopped);
    EXPECT_EQ(state.restart_count(), 0u);
}

// ── Health and status ───────────────────────────────────────

TEST_F(LifecycleControllerTest, CheckHealthFalseWithoutListener) {
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(controller->check_health());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST_F(LifecycleControllerTest, StatusReportsLiveWorkerNumbers) {
    FakeWorker existing(port, R"({"status":"healthy","memories":12,"uptime":90,"version":"1.4.2"})");
    ASSERT_TRUE(existing.bound());
    ASSERT_TRUE(controller->start().success);
    EXPECT_TRUE(controller->check_health());

    auto status = controller->get_status();
    EXPECT_TRUE(status.running);
    EXPECT_EQ(status.status, "healthy");
    EXPECT_EQ(status.port, port);
    EXPECT_EQ(status.worker_reported_count, 12u);
    ASSERT_TRUE(status.uptime.has_value());
    EXPECT_EQ(*status.uptime, 90u);
    EXPECT_EQ(status.version, "1.4.2");
}

TEST_F(LifecycleControllerTest, StatusWhileStarting) {
    ASSERT_TRUE(controller->start().success);
    auto status = controller->get_status();
    EXPECT_FALSE(status.running);
    EXPECT_EQ(status.status, "starting");
    EXPECT_EQ(status.worker_reported_count, 0u);
    EXPECT_FALSE(status.uptime.has_value());
}

TEST_F(LifecycleControllerTest, DeclareUnhealthyRequestsRestart) {
    EXPECT_FALSE(controller->declare_unhealthy());

    ASSERT_TRUE(controller->start().success);
    ASSERT_TRUE(wait_for("status-changed:running"));
    pid_t pid = state.snapshot().pid;

    EXPECT_TRUE(controller->declare_unhealthy());
    EXPECT_EQ(state.status(), WorkerStatus::Crashed);
    EXPECT_FALSE(state.has_process());
    EXPECT_NE(::kill(pid, 0), 0);
    EXPECT_TRUE(wait_for("restart-needed"));

    // The superseded monitor must not count a restart
    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(state.restart_count(), 0u);
    EXPECT_FALSE(controller->declare_unhealthy());
}
