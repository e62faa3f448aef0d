#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bus/events.hpp"
#include "session/session_types.hpp"

namespace heartcore::session {

inline constexpr const char* kProactiveOwner = "@proactive";

inline void MarkDirtyLocked(SessionData& data) {
    data.dirty = true;
    ++data.mutation_seq;
}

// Once per local date: adds daily_recovery energy (capped at 1) and resets
// mood. Returns true when it ran. Caller holds the entry's mutex.
bool ApplyDailyReset(SessionData& data, TimePoint now, double daily_recovery);

enum class Admission {
    kOpenedCycle,
    kExtendedCycle,
    kDeferred
};

struct AdmitResult {
    Admission admission = Admission::kDeferred;
    std::uint64_t cycle_id = 0;
    std::size_t dropped = 0;
};

struct ClosingBatch {
    std::uint64_t cycle_id = 0;
    std::vector<heartcore::bus::InboundMessage> batch;
    double energy = 0.0;
    double mood = 0.0;
    std::vector<heartcore::bus::InboundMessage> ambient_context;
    // Opened by the maintenance tick rather than by a message; batch is empty.
    bool proactive = false;
};

struct HandOff {
    std::uint64_t cycle_id = 0;
    std::string owner_sender_id;
    std::size_t batch_size = 0;
};

// One cached session. All fields live in SessionData behind a single mutex;
// the generation lock is the `locked` flag, not a mutex, because it is held
// across scheduler tasks.
class SessionState {
public:
    SessionState(const PersistedState& persisted, TimePoint now, bool dirty);

    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;

    const std::string& Id() const { return id_; }

    // Routes an admitted (REPLY/WAIT) message: opens a cycle on an idle
    // session, extends the owner's open window, or defers to the background
    // pool (dropping the oldest past capacity).
    AdmitResult Admit(const heartcore::bus::InboundMessage& msg, std::size_t background_capacity, TimePoint now);

    void AppendAmbient(const heartcore::bus::InboundMessage& msg, std::size_t capacity);

    // Close time of the current window, or nullopt when cycle_id is no longer
    // the open window.
    std::optional<TimePoint> WindowDeadline(
        std::uint64_t cycle_id,
        std::chrono::milliseconds quiet_period,
        std::chrono::milliseconds max_window) const;

    // Waiting -> Closing. Drains the accumulation pool in arrival order.
    std::optional<ClosingBatch> BeginClosing(std::uint64_t cycle_id);

    // Idle -> Closing with an empty batch, owned by kProactiveOwner. Returns
    // nullopt when the session is already locked.
    std::optional<ClosingBatch> BeginProactive(TimePoint now);

    // Closing -> Done. Either releases the lock or, when deferred messages
    // are waiting, hands the lock to the earliest deferred sender and opens
    // the next window without an unlocked gap.
    std::optional<HandOff> FinishCycle(std::uint64_t cycle_id, TimePoint now);

    void Touch(TimePoint now);
    bool IsBusy() const;
    bool IsDirty() const;
    SessionSnapshot Snapshot() const;

    template <typename Fn>
    auto WithData(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(data_);
    }

    template <typename Fn>
    auto WithData(Fn&& fn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(static_cast<const SessionData&>(data_));
    }

    // Persisted view plus the mutation sequence it was taken at, or nullopt
    // when clean.
    std::optional<std::pair<PersistedState, std::uint64_t>> DirtySnapshot() const;
    void ClearDirty(std::uint64_t mutation_seq);

private:
    const std::string id_;
    SessionData data_;
    mutable std::mutex mutex_;
};

}  // namespace heartcore::session
