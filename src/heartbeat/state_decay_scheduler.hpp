#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "config/config_schema.hpp"
#include "session/session_state_store.hpp"

namespace heartcore::heartbeat {

struct DecayOptions {
    std::chrono::seconds interval{60};
    std::chrono::minutes recovery_silence{60};
    double recovery_increment = 0.1;
    double recovery_ceiling = 0.8;
    std::chrono::seconds mood_decay_interval{1800};
    double mood_decay_step = 0.1;
    double daily_recovery = 0.2;
    std::chrono::seconds eviction_ttl{600};

    bool proactive_enabled = false;
    double proactive_energy_threshold = 0.6;
    std::chrono::minutes proactive_silence{180};
    std::chrono::seconds proactive_cooldown{1800};
};

DecayOptions MakeDecayOptions(const heartcore::config::Config& config);

struct TickReport {
    std::size_t sessions = 0;
    std::size_t recovered = 0;
    std::size_t mood_decayed = 0;
    std::size_t daily_reset = 0;
    std::size_t flushed = 0;
    std::size_t flush_failed = 0;
    std::size_t evicted = 0;
    std::size_t proactive = 0;
};

// Maintenance tick over the cached sessions, independent of message flow:
// passive energy recovery, mood decay, the once-a-day reset, write-back of
// dirty entries, and eviction of idle ones.
//
// With proactive wake-up enabled, the tick also hands an idle, rested
// session that has been silent long enough to `on_wake`, at most once per
// global cooldown.
class StateDecayScheduler {
public:
    // Returns true when a cycle was started.
    using WakeHandler = std::function<bool(std::shared_ptr<heartcore::session::SessionState>)>;

    StateDecayScheduler(
        heartcore::session::SessionStateStore& store,
        DecayOptions options,
        WakeHandler on_wake = {},
        bool enabled = true);
    ~StateDecayScheduler();

    void Start();
    void Stop();
    TickReport TickNow();

private:
    void RunLoop();
    // Called with the entry's mutex held.
    void Decay(heartcore::session::SessionData& data, heartcore::utils::TimePoint now, TickReport& report) const;
    bool WantsWake(const heartcore::session::SessionData& data, heartcore::utils::TimePoint now) const;

    heartcore::session::SessionStateStore& store_;
    DecayOptions options_;
    WakeHandler on_wake_;
    bool enabled_ = true;
    std::optional<heartcore::utils::TimePoint> last_wake_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::thread worker_;
};

}  // namespace heartcore::heartbeat
