#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "scheduler/task_scheduler.hpp"

namespace heartcore::scheduler {

class ThreadPoolScheduler : public TaskScheduler {
public:
    explicit ThreadPoolScheduler(std::size_t worker_count = 4);
    ~ThreadPoolScheduler() override;

    ThreadPoolScheduler(const ThreadPoolScheduler&) = delete;
    ThreadPoolScheduler& operator=(const ThreadPoolScheduler&) = delete;

    void Start();
    void Stop();

    TimePoint Now() const override;
    void Post(Task task) override;
    void PostAt(TimePoint when, Task task) override;

    std::size_t PendingCount() const;

private:
    struct Entry {
        TimePoint when;
        std::uint64_t seq = 0;
        Task task;
    };

    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.when != b.when) {
                return a.when > b.when;
            }
            return a.seq > b.seq;
        }
    };

    void WorkerLoop();

    std::size_t worker_count_;
    std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
    std::uint64_t next_seq_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;
};

}  // namespace heartcore::scheduler
