#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "agent/generator.hpp"
#include "bus/events.hpp"
#include "config/config_schema.hpp"
#include "scheduler/task_scheduler.hpp"
#include "session/session_state.hpp"
#include "session/session_state_store.hpp"

namespace heartcore::dispatch {

struct DebounceOptions {
    std::chrono::milliseconds quiet_period{2000};
    std::chrono::milliseconds max_window{15000};
    double energy_cost = 0.05;
};

DebounceOptions MakeDebounceOptions(const heartcore::config::Config& config);

// Drives one cycle per session: Waiting until the owner goes quiet (or the
// hard ceiling passes), then Closing, generation, state delta, and either
// lock release or hand-off to the next deferred sender.
//
// Window timers run on `timers`; generation and everything after it run on
// `workers`, so a slow generation in one session never delays the window
// deadlines of another.
class DebounceAggregator {
public:
    using ReplySink = std::function<void(const heartcore::bus::OutboundMessage&)>;
    using SessionPtr = std::shared_ptr<heartcore::session::SessionState>;

    DebounceAggregator(
        heartcore::session::SessionStateStore& store,
        heartcore::scheduler::TaskScheduler& timers,
        heartcore::scheduler::TaskScheduler& workers,
        heartcore::agent::Generator& generator,
        DebounceOptions options,
        ReplySink sink = {});

    // Starts watching a cycle the session has just opened.
    void Open(SessionPtr session, std::uint64_t cycle_id);

    // Starts an unprompted cycle on an idle session. Returns false when the
    // session is locked.
    bool OpenProactive(SessionPtr session);

    std::uint64_t CompletedCycles() const { return completed_cycles_.load(); }
    std::uint64_t FailedCycles() const { return failed_cycles_.load(); }

private:
    void CheckWindow(SessionPtr session, std::uint64_t cycle_id);
    void RunCycle(SessionPtr session, heartcore::session::ClosingBatch closing);

    heartcore::session::SessionStateStore& store_;
    heartcore::scheduler::TaskScheduler& timers_;
    heartcore::scheduler::TaskScheduler& workers_;
    heartcore::agent::Generator& generator_;
    DebounceOptions options_;
    ReplySink sink_;
    std::atomic<std::uint64_t> completed_cycles_{0};
    std::atomic<std::uint64_t> failed_cycles_{0};
};

}  // namespace heartcore::dispatch
