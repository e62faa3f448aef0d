#include "scheduler/thread_pool_scheduler.hpp"

#include <exception>
#include <string>

#include "utils/logging.hpp"

namespace heartcore::scheduler {

ThreadPoolScheduler::ThreadPoolScheduler(std::size_t worker_count)
    : worker_count_(worker_count == 0 ? 1 : worker_count) {}

ThreadPoolScheduler::~ThreadPoolScheduler() {
    Stop();
}

void ThreadPoolScheduler::Start() {
    if (running_.exchange(true)) {
        return;
    }
    workers_.reserve(worker_count_);
    for (std::size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this]() { WorkerLoop(); });
    }
    heartcore::utils::LogDebug("scheduler", "started", {{"workers", std::to_string(worker_count_)}});
}

void ThreadPoolScheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    heartcore::utils::LogDebug("scheduler", "stopped", {{"dropped", std::to_string(PendingCount())}});
}

TimePoint ThreadPoolScheduler::Now() const {
    return std::chrono::system_clock::now();
}

void ThreadPoolScheduler::Post(Task task) {
    PostAt(Now(), std::move(task));
}

void ThreadPoolScheduler::PostAt(TimePoint when, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(Entry{when, next_seq_++, std::move(task)});
    }
    cv_.notify_one();
}

std::size_t ThreadPoolScheduler::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ThreadPoolScheduler::WorkerLoop() {
    while (running_) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
                continue;
            }
            const auto due = queue_.top().when;
            if (due > Now()) {
                cv_.wait_until(lock, due);
                continue;
            }
            // top() is const; the entry is popped right after the move
            task = std::move(const_cast<Entry&>(queue_.top()).task);
            queue_.pop();
        }
        if (!task) {
            continue;
        }
        try {
            task();
        } catch (const std::exception& ex) {
            heartcore::utils::LogError("scheduler", "task failed", {{"error", ex.what()}});
        }
    }
}

}  // namespace heartcore::scheduler
