#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "session/session_state.hpp"
#include "session/state_store.hpp"

namespace heartcore::session {

struct StoreOptions {
    double initial_energy = 0.8;
    double daily_recovery = 0.2;
};

struct CycleDelta {
    double energy_cost = 0.0;
    bool success = false;
    double mood_delta = 0.0;
};

// Lazy-loading write-back cache of session state. The map mutex only makes
// insert-if-absent atomic; it is never held across a durable load, a
// classifier call or a generator call.
//
// An entry whose load failed runs on defaults and is never written back
// until a later Get or Flush reads the row; its local changes are then
// replayed onto the row.
class SessionStateStore {
public:
    using NowFn = std::function<TimePoint()>;

    SessionStateStore(StateStore& store, StoreOptions options, NowFn now = heartcore::utils::Now);

    std::shared_ptr<SessionState> Get(const std::string& session_id);
    std::shared_ptr<SessionState> Find(const std::string& session_id) const;

    bool MarkDirty(const std::string& session_id);
    bool Flush(const std::string& session_id);
    bool EvictIfIdle(const std::string& session_id, std::chrono::seconds ttl);
    std::size_t FlushAll();

    void ApplyCycleDelta(SessionState& state, const CycleDelta& delta);

    std::vector<std::string> SessionIds() const;
    std::vector<SessionSnapshot> Snapshots() const;
    std::size_t Size() const;
    TimePoint Now() const { return now_(); }

private:
    std::shared_ptr<SessionState> Create(const std::string& session_id, TimePoint now);
    // Returns false while the durable row is still unreadable.
    bool ReloadIfPending(SessionState& state);

    StateStore& store_;
    StoreOptions options_;
    NowFn now_;
    std::unordered_map<std::string, std::shared_ptr<SessionState>> cache_;
    mutable std::mutex mutex_;
};

}  // namespace heartcore::session
