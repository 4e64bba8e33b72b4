#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/// Owns the supervisor's background tasks. Every sleep a task does goes
/// through sleep_for() so cancel() wakes it; join() waits for all of them.
class TaskGroup {
public:
    TaskGroup();
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /// Start a task. Returns false (and drops the task) after cancel().
    bool spawn(const std::string& name, std::function<void()> task);

    /// Sleep unless cancelled. Returns true if the full duration elapsed.
    bool sleep_for(std::chrono::milliseconds duration);

    void cancel();
    bool cancelled() const;

    /// Wait for every task, including ones spawned while joining.
    /// Must not be called from inside a task.
    void join();

    /// Tasks that have not finished yet
    std::size_t active() const;

private:
    struct Task {
        std::string name;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    std::list<Task> tasks_;

    void reap_finished_locked();
};
