#include "session/session_state_store.hpp"

#include <exception>
#include <utility>

#include "utils/logging.hpp"

namespace heartcore::session {

SessionStateStore::SessionStateStore(StateStore& store, StoreOptions options, NowFn now)
    : store_(store)
    , options_(options)
    , now_(std::move(now)) {
    options_.initial_energy = heartcore::utils::Clamp(options_.initial_energy, 0.0, 1.0);
}

std::shared_ptr<SessionState> SessionStateStore::Get(const std::string& session_id) {
    const auto now = now_();
    auto state = Find(session_id);
    if (state) {
        ReloadIfPending(*state);
    } else {
        auto created = Create(session_id, now);
        std::lock_guard<std::mutex> lock(mutex_);
        // another caller may have loaded the same id meanwhile
        state = cache_.try_emplace(session_id, std::move(created)).first->second;
    }
    state->WithData([&](SessionData& data) {
        data.last_access_time = now;
        if (ApplyDailyReset(data, now, options_.daily_recovery)) {
            heartcore::utils::LogInfo("store", "daily reset", {
                {"session", data.session_id}, {"energy", std::to_string(data.energy)}});
        }
    });
    return state;
}

std::shared_ptr<SessionState> SessionStateStore::Create(const std::string& session_id, TimePoint now) {
    std::optional<PersistedState> loaded;
    bool load_failed = false;
    try {
        loaded = store_.Load(session_id);
    } catch (const std::exception& ex) {
        load_failed = true;
        heartcore::utils::LogWarn("store", "load failed, starting from defaults", {
            {"session", session_id}, {"error", ex.what()}});
    }

    if (loaded.has_value()) {
        loaded->session_id = session_id;
        heartcore::utils::LogDebug("store", "state loaded", {{"session", session_id}});
        return std::make_shared<SessionState>(*loaded, now, false);
    }

    PersistedState fresh{};
    fresh.session_id = session_id;
    fresh.energy = options_.initial_energy;
    fresh.mood = 0.0;
    fresh.last_reset_date = heartcore::utils::LocalDate(now);
    auto state = std::make_shared<SessionState>(fresh, now, !load_failed);
    if (load_failed) {
        state->WithData([&fresh](SessionData& data) {
            data.load_pending = true;
            data.load_baseline = fresh;
        });
    } else {
        heartcore::utils::LogInfo("store", "new state created", {{"session", session_id}});
    }
    return state;
}

bool SessionStateStore::ReloadIfPending(SessionState& state) {
    const bool pending = state.WithData([](const SessionData& data) { return data.load_pending; });
    if (!pending) {
        return true;
    }
    std::optional<PersistedState> row;
    try {
        row = store_.Load(state.Id());
    } catch (const std::exception& ex) {
        heartcore::utils::LogWarn("store", "reload failed", {{"session", state.Id()}, {"error", ex.what()}});
        return false;
    }
    state.WithData([&row](SessionData& data) {
        if (!data.load_pending) {
            return;
        }
        if (row.has_value()) {
            const auto& base = data.load_baseline;
            data.energy = heartcore::utils::Clamp(row->energy + (data.energy - base.energy), 0.0, 1.0);
            data.mood = heartcore::utils::Clamp(row->mood + (data.mood - base.mood), -1.0, 1.0);
            data.total_replies = row->total_replies + (data.total_replies - base.total_replies);
            if (row->last_reply_time.has_value() &&
                (!data.last_reply_time.has_value() || *row->last_reply_time > *data.last_reply_time)) {
                data.last_reply_time = row->last_reply_time;
            }
            // a reset that already ran locally stays applied
            if (data.last_daily_reset_date == base.last_reset_date) {
                data.last_daily_reset_date = row->last_reset_date;
            }
        }
        data.load_pending = false;
        MarkDirtyLocked(data);
    });
    heartcore::utils::LogInfo("store", "state reloaded", {
        {"session", state.Id()}, {"row", row.has_value() ? "found" : "absent"}});
    return true;
}

std::shared_ptr<SessionState> SessionStateStore::Find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(session_id);
    if (it == cache_.end()) {
        return nullptr;
    }
    return it->second;
}

bool SessionStateStore::MarkDirty(const std::string& session_id) {
    auto state = Find(session_id);
    if (!state) {
        return false;
    }
    const auto now = now_();
    state->WithData([now](SessionData& data) {
        MarkDirtyLocked(data);
        data.last_access_time = now;
    });
    return true;
}

bool SessionStateStore::Flush(const std::string& session_id) {
    auto state = Find(session_id);
    if (!state) {
        return false;
    }
    if (!ReloadIfPending(*state)) {
        heartcore::utils::LogWarn("store", "flush held until the stored row loads", {{"session", session_id}});
        return false;
    }
    auto snapshot = state->DirtySnapshot();
    if (!snapshot.has_value()) {
        return true;
    }
    bool saved = false;
    try {
        saved = store_.Save(session_id, snapshot->first);
    } catch (const std::exception& ex) {
        heartcore::utils::LogWarn("store", "save threw", {{"session", session_id}, {"error", ex.what()}});
    }
    if (!saved) {
        heartcore::utils::LogWarn("store", "flush failed, will retry", {{"session", session_id}});
        return false;
    }
    state->ClearDirty(snapshot->second);
    return true;
}

bool SessionStateStore::EvictIfIdle(const std::string& session_id, std::chrono::seconds ttl) {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(session_id);
    if (it == cache_.end()) {
        return false;
    }
    auto& state = it->second;
    const bool refused = state->WithData([&](const SessionData& data) {
        if (now - data.last_access_time < ttl) {
            return true;
        }
        if (data.locked || !data.accumulation_pool.empty() || !data.background_pool.empty() || data.dirty) {
            heartcore::utils::LogDebug("store", "eviction refused", {
                {"session", session_id},
                {"locked", data.locked ? "true" : "false"},
                {"dirty", data.dirty ? "true" : "false"}});
            return true;
        }
        return false;
    });
    // a caller between Get() and routing still holds a reference
    if (refused || state.use_count() > 1) {
        return false;
    }
    cache_.erase(it);
    heartcore::utils::LogDebug("store", "evicted", {{"session", session_id}});
    return true;
}

std::size_t SessionStateStore::FlushAll() {
    std::size_t failed = 0;
    for (const auto& id : SessionIds()) {
        if (!Flush(id)) {
            failed += 1;
        }
    }
    return failed;
}

void SessionStateStore::ApplyCycleDelta(SessionState& state, const CycleDelta& delta) {
    const auto now = now_();
    state.WithData([&](SessionData& data) {
        data.energy = heartcore::utils::Clamp(data.energy - delta.energy_cost, 0.0, 1.0);
        if (delta.success) {
            const auto mood = heartcore::utils::Clamp(data.mood + delta.mood_delta, -1.0, 1.0);
            if (mood != data.mood) {
                data.mood = mood;
                data.last_mood_change_time = now;
            }
            data.total_replies += 1;
            data.last_reply_time = now;
        }
        data.last_access_time = now;
        MarkDirtyLocked(data);
        heartcore::utils::LogDebug("store", "cycle delta applied", {
            {"session", data.session_id},
            {"energy", std::to_string(data.energy)},
            {"mood", std::to_string(data.mood)},
            {"success", delta.success ? "true" : "false"}});
    });
}

std::vector<std::string> SessionStateStore::SessionIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(cache_.size());
    for (const auto& [id, _] : cache_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<SessionSnapshot> SessionStateStore::Snapshots() const {
    std::vector<std::shared_ptr<SessionState>> states;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        states.reserve(cache_.size());
        for (const auto& [_, state] : cache_) {
            states.push_back(state);
        }
    }
    std::vector<SessionSnapshot> snapshots;
    snapshots.reserve(states.size());
    for (const auto& state : states) {
        snapshots.push_back(state->Snapshot());
    }
    return snapshots;
}

std::size_t SessionStateStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

}  // namespace heartcore::session
