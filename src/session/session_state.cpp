#include "session/session_state.hpp"

#include <algorithm>
#include <iterator>

namespace heartcore::session {
namespace {

using heartcore::bus::InboundMessage;

void InsertByArrival(std::deque<InboundMessage>& pool, const InboundMessage& msg) {
    const auto pos = std::upper_bound(
        pool.begin(), pool.end(), msg.arrival_time,
        [](const auto& when, const InboundMessage& item) { return when < item.arrival_time; });
    pool.insert(pos, msg);
}

}  // namespace

bool ApplyDailyReset(SessionData& data, TimePoint now, double daily_recovery) {
    const auto today = heartcore::utils::LocalDate(now);
    if (data.last_daily_reset_date == today) {
        return false;
    }
    data.last_daily_reset_date = today;
    data.energy = std::min(1.0, data.energy + daily_recovery);
    data.mood = 0.0;
    data.last_mood_change_time = now;
    MarkDirtyLocked(data);
    return true;
}

SessionState::SessionState(const PersistedState& persisted, TimePoint now, bool dirty)
    : id_(persisted.session_id) {
    data_.session_id = persisted.session_id;
    data_.energy = heartcore::utils::Clamp(persisted.energy, 0.0, 1.0);
    data_.mood = heartcore::utils::Clamp(persisted.mood, -1.0, 1.0);
    data_.total_replies = persisted.total_replies;
    data_.last_daily_reset_date = persisted.last_reset_date;
    data_.last_reply_time = persisted.last_reply_time;
    data_.created_time = now;
    data_.last_access_time = now;
    data_.last_mood_change_time = now;
    data_.dirty = dirty;
}

AdmitResult SessionState::Admit(const InboundMessage& msg, std::size_t background_capacity, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.last_access_time = now;
    AdmitResult result{};

    if (!data_.locked) {
        data_.locked = true;
        data_.owner_sender_id = msg.sender_id;
        data_.phase = CyclePhase::kWaiting;
        data_.cycle_id += 1;
        data_.cycle_opened_at = now;
        data_.last_owner_append_at = now;
        InsertByArrival(data_.accumulation_pool, msg);
        result.admission = Admission::kOpenedCycle;
        result.cycle_id = data_.cycle_id;
        return result;
    }

    result.cycle_id = data_.cycle_id;
    if (data_.phase == CyclePhase::kWaiting && data_.owner_sender_id == msg.sender_id) {
        InsertByArrival(data_.accumulation_pool, msg);
        data_.last_owner_append_at = now;
        result.admission = Admission::kExtendedCycle;
        return result;
    }

    // Other senders, or the owner after the window already closed.
    InsertByArrival(data_.background_pool, msg);
    while (data_.background_pool.size() > background_capacity) {
        data_.background_pool.pop_front();
        result.dropped += 1;
    }
    result.admission = Admission::kDeferred;
    return result;
}

void SessionState::AppendAmbient(const InboundMessage& msg, std::size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity == 0) {
        return;
    }
    data_.ambient_context.push_back(msg);
    while (data_.ambient_context.size() > capacity) {
        data_.ambient_context.pop_front();
    }
}

std::optional<TimePoint> SessionState::WindowDeadline(
    std::uint64_t cycle_id,
    std::chrono::milliseconds quiet_period,
    std::chrono::milliseconds max_window) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!data_.locked || data_.cycle_id != cycle_id || data_.phase != CyclePhase::kWaiting) {
        return std::nullopt;
    }
    const auto quiet_deadline = data_.last_owner_append_at + quiet_period;
    const auto hard_deadline = data_.cycle_opened_at + max_window;
    return std::min(quiet_deadline, hard_deadline);
}

std::optional<ClosingBatch> SessionState::BeginClosing(std::uint64_t cycle_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!data_.locked || data_.cycle_id != cycle_id || data_.phase != CyclePhase::kWaiting) {
        return std::nullopt;
    }
    data_.phase = CyclePhase::kClosing;
    ClosingBatch closing{};
    closing.cycle_id = cycle_id;
    closing.batch.assign(
        std::make_move_iterator(data_.accumulation_pool.begin()),
        std::make_move_iterator(data_.accumulation_pool.end()));
    data_.accumulation_pool.clear();
    closing.energy = data_.energy;
    closing.mood = data_.mood;
    closing.ambient_context.assign(data_.ambient_context.begin(), data_.ambient_context.end());
    return closing;
}

std::optional<ClosingBatch> SessionState::BeginProactive(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (data_.locked) {
        return std::nullopt;
    }
    data_.locked = true;
    data_.owner_sender_id = kProactiveOwner;
    data_.phase = CyclePhase::kClosing;
    data_.cycle_id += 1;
    data_.cycle_opened_at = now;
    data_.last_owner_append_at = now;
    data_.last_access_time = now;

    ClosingBatch closing{};
    closing.cycle_id = data_.cycle_id;
    closing.energy = data_.energy;
    closing.mood = data_.mood;
    closing.ambient_context.assign(data_.ambient_context.begin(), data_.ambient_context.end());
    closing.proactive = true;
    return closing;
}

std::optional<HandOff> SessionState::FinishCycle(std::uint64_t cycle_id, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!data_.locked || data_.cycle_id != cycle_id || data_.phase != CyclePhase::kClosing) {
        return std::nullopt;
    }
    if (data_.background_pool.empty()) {
        data_.locked = false;
        data_.owner_sender_id.reset();
        data_.phase = CyclePhase::kIdle;
        return std::nullopt;
    }

    for (auto& msg : data_.background_pool) {
        InsertByArrival(data_.accumulation_pool, msg);
    }
    data_.background_pool.clear();
    data_.owner_sender_id = data_.accumulation_pool.front().sender_id;
    data_.phase = CyclePhase::kWaiting;
    data_.cycle_id += 1;
    data_.cycle_opened_at = now;
    data_.last_owner_append_at = now;
    data_.last_access_time = now;

    HandOff handoff{};
    handoff.cycle_id = data_.cycle_id;
    handoff.owner_sender_id = *data_.owner_sender_id;
    handoff.batch_size = data_.accumulation_pool.size();
    return handoff;
}

void SessionState::Touch(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.last_access_time = now;
}

bool SessionState::IsBusy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.locked || !data_.accumulation_pool.empty() || !data_.background_pool.empty();
}

bool SessionState::IsDirty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.dirty;
}

SessionSnapshot SessionState::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionSnapshot snapshot{};
    snapshot.session_id = data_.session_id;
    snapshot.energy = data_.energy;
    snapshot.mood = data_.mood;
    snapshot.total_replies = data_.total_replies;
    snapshot.locked = data_.locked;
    snapshot.owner_sender_id = data_.owner_sender_id;
    snapshot.phase = data_.phase;
    snapshot.cycle_id = data_.cycle_id;
    snapshot.accumulation_size = data_.accumulation_pool.size();
    snapshot.background_size = data_.background_pool.size();
    snapshot.ambient_size = data_.ambient_context.size();
    snapshot.last_reply_time = data_.last_reply_time;
    snapshot.last_daily_reset_date = data_.last_daily_reset_date;
    snapshot.last_access_time = data_.last_access_time;
    snapshot.dirty = data_.dirty;
    snapshot.load_pending = data_.load_pending;
    return snapshot;
}

std::optional<std::pair<PersistedState, std::uint64_t>> SessionState::DirtySnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!data_.dirty) {
        return std::nullopt;
    }
    PersistedState persisted{};
    persisted.session_id = data_.session_id;
    persisted.energy = data_.energy;
    persisted.mood = data_.mood;
    persisted.last_reset_date = data_.last_daily_reset_date;
    persisted.total_replies = data_.total_replies;
    persisted.last_reply_time = data_.last_reply_time;
    return std::make_pair(std::move(persisted), data_.mutation_seq);
}

void SessionState::ClearDirty(std::uint64_t mutation_seq) {
    std::lock_guard<std::mutex> lock(mutex_);
    // a mutation after the snapshot keeps the entry dirty
    if (data_.mutation_seq == mutation_seq) {
        data_.dirty = false;
    }
}

}  // namespace heartcore::session
