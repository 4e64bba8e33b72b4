#include "supervisor/task_group.hpp"
#include "core/logging.hpp"

#include <exception>

TaskGroup::TaskGroup() = default;

TaskGroup::~TaskGroup() {
    cancel();
    join();
}

bool TaskGroup::spawn(const std::string& name, std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) return false;

    reap_finished_locked();

    auto done = std::make_shared<std::atomic<bool>>(false);
    Task entry;
    entry.name = name;
    entry.done = done;
    entry.thread = std::thread([name, done, task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            supervisor_logger()->error("Task '{}' failed: {}", name, e.what());
        }
        done->store(true);
    });
    tasks_.push_back(std::move(entry));
    return true;
}

bool TaskGroup::sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
}

void TaskGroup::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool TaskGroup::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void TaskGroup::join() {
    while (true) {
        std::list<Task> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.empty()) return;
            pending.swap(tasks_);
        }
        for (auto& t : pending) {
            if (t.thread.joinable()) {
                t.thread.join();
            }
        }
    }
}

std::size_t TaskGroup::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& t : tasks_) {
        if (!t.done->load()) ++count;
    }
    return count;
}

void TaskGroup::reap_finished_locked() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}
