#pragma once

#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "bus/message_bus.hpp"
#include "dispatch/dual_pool_dispatcher.hpp"
#include "scheduler/task_scheduler.hpp"

namespace heartcore::dispatch {

// Drains the inbound bus and fans messages out to the worker scheduler.
// Messages of one session run one at a time in bus order; different
// sessions route in parallel, so a slow classifier call only delays its
// own session.
class DispatchLoop {
public:
    DispatchLoop(
        heartcore::bus::MessageBus& bus,
        DualPoolDispatcher& dispatcher,
        heartcore::scheduler::TaskScheduler& workers);
    ~DispatchLoop();

    void Start();
    void Stop();

private:
    void Run();
    void Enqueue(heartcore::bus::InboundMessage msg);
    void Drain(const std::string& session_id);

    heartcore::bus::MessageBus& bus_;
    DualPoolDispatcher& dispatcher_;
    heartcore::scheduler::TaskScheduler& workers_;
    std::atomic<bool> running_{false};
    std::thread worker_;

    // A session has an entry while one drain task owns it.
    std::mutex strands_mutex_;
    std::unordered_map<std::string, std::deque<heartcore::bus::InboundMessage>> strands_;
};

}  // namespace heartcore::dispatch
