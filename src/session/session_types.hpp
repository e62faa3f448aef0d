#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include "bus/events.hpp"
#include "utils/common.hpp"

namespace heartcore::session {

using heartcore::utils::TimePoint;

enum class CyclePhase {
    kIdle,
    kWaiting,
    kClosing
};

inline const char* ToString(CyclePhase phase) {
    switch (phase) {
        case CyclePhase::kIdle: return "idle";
        case CyclePhase::kWaiting: return "waiting";
        case CyclePhase::kClosing: return "closing";
    }
    return "idle";
}

// Fields that survive a restart.
struct PersistedState {
    std::string session_id;
    double energy = 0.8;
    double mood = 0.0;
    std::string last_reset_date;
    int total_replies = 0;
    std::optional<TimePoint> last_reply_time;
};

// Everything an entry holds. Guarded by SessionState's mutex.
struct SessionData {
    std::string session_id;
    double energy = 0.8;
    double mood = 0.0;
    int total_replies = 0;

    // Generation lock. owner_sender_id is set iff locked.
    bool locked = false;
    std::optional<std::string> owner_sender_id;
    CyclePhase phase = CyclePhase::kIdle;
    std::uint64_t cycle_id = 0;
    TimePoint cycle_opened_at{};
    TimePoint last_owner_append_at{};

    std::deque<heartcore::bus::InboundMessage> accumulation_pool;
    std::deque<heartcore::bus::InboundMessage> background_pool;
    std::deque<heartcore::bus::InboundMessage> ambient_context;

    std::optional<TimePoint> last_reply_time;
    std::string last_daily_reset_date;
    TimePoint created_time{};
    TimePoint last_access_time{};
    TimePoint last_mood_change_time{};

    bool dirty = false;
    std::uint64_t mutation_seq = 0;

    // Set while the durable row could not be read. The entry then runs on
    // defaults; load_baseline is what those defaults were, so local changes
    // can be replayed onto the real row once it loads.
    bool load_pending = false;
    PersistedState load_baseline;
};

struct SessionSnapshot {
    std::string session_id;
    double energy = 0.0;
    double mood = 0.0;
    int total_replies = 0;
    bool locked = false;
    std::optional<std::string> owner_sender_id;
    CyclePhase phase = CyclePhase::kIdle;
    std::uint64_t cycle_id = 0;
    std::size_t accumulation_size = 0;
    std::size_t background_size = 0;
    std::size_t ambient_size = 0;
    std::optional<TimePoint> last_reply_time;
    std::string last_daily_reset_date;
    TimePoint last_access_time{};
    bool dirty = false;
    bool load_pending = false;
};

}  // namespace heartcore::session
