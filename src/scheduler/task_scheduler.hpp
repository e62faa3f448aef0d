#pragma once

#include <chrono>
#include <functional>
#include <utility>

namespace heartcore::scheduler {

using Task = std::function<void()>;
using TimePoint = std::chrono::system_clock::time_point;

// Runs short tasks, now or at a deadline. Every timer and every re-trigger
// in the dispatch core goes through here as a fresh task.
class TaskScheduler {
public:
    virtual ~TaskScheduler() = default;
    virtual TimePoint Now() const = 0;
    virtual void Post(Task task) = 0;
    virtual void PostAt(TimePoint when, Task task) = 0;

    template <typename Rep, typename Period>
    void PostAfter(std::chrono::duration<Rep, Period> delay, Task task) {
        PostAt(Now() + std::chrono::duration_cast<std::chrono::system_clock::duration>(delay),
               std::move(task));
    }
};

}  // namespace heartcore::scheduler
