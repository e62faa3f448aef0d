#include "heartbeat/state_decay_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "utils/logging.hpp"

namespace heartcore::heartbeat {

DecayOptions MakeDecayOptions(const heartcore::config::Config& config) {
    DecayOptions options{};
    options.interval = std::chrono::seconds(config.cache.maintenance_interval_s);
    options.recovery_silence = std::chrono::minutes(config.energy.recovery_silence_minutes);
    options.recovery_increment = config.energy.recovery_increment;
    options.recovery_ceiling = config.energy.recovery_ceiling;
    options.mood_decay_interval = std::chrono::seconds(config.mood.decay_interval_s);
    options.mood_decay_step = config.mood.decay_step;
    options.daily_recovery = config.energy.daily_recovery;
    options.eviction_ttl = std::chrono::seconds(config.cache.eviction_ttl_s);
    options.proactive_enabled = config.proactive.enabled;
    options.proactive_energy_threshold = config.proactive.energy_threshold;
    options.proactive_silence = std::chrono::minutes(config.proactive.silence_threshold_minutes);
    options.proactive_cooldown = std::chrono::seconds(config.proactive.global_cooldown_s);
    return options;
}

StateDecayScheduler::StateDecayScheduler(
    heartcore::session::SessionStateStore& store,
    DecayOptions options,
    WakeHandler on_wake,
    bool enabled)
    : store_(store)
    , options_(options)
    , on_wake_(std::move(on_wake))
    , enabled_(enabled) {}

StateDecayScheduler::~StateDecayScheduler() {
    Stop();
}

void StateDecayScheduler::Start() {
    if (!enabled_ || running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { RunLoop(); });
}

void StateDecayScheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void StateDecayScheduler::RunLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, options_.interval, [this]() { return !running_; });
        }
        if (!running_) {
            break;
        }
        try {
            TickNow();
        } catch (const std::exception& ex) {
            heartcore::utils::LogError("decay", "tick failed", {{"error", ex.what()}});
        }
    }
}

void StateDecayScheduler::Decay(
    heartcore::session::SessionData& data,
    heartcore::utils::TimePoint now,
    TickReport& report) const {
    if (heartcore::session::ApplyDailyReset(data, now, options_.daily_recovery)) {
        report.daily_reset += 1;
        heartcore::utils::LogInfo("decay", "daily reset", {
            {"session", data.session_id}, {"energy", std::to_string(data.energy)}});
    }

    const auto idle_since = data.last_reply_time.value_or(data.created_time);
    if (now - idle_since >= options_.recovery_silence && data.energy < options_.recovery_ceiling) {
        data.energy = std::min(options_.recovery_ceiling, data.energy + options_.recovery_increment);
        heartcore::session::MarkDirtyLocked(data);
        report.recovered += 1;
        heartcore::utils::LogDebug("decay", "passive recovery", {
            {"session", data.session_id}, {"energy", std::to_string(data.energy)}});
    }

    if (data.mood != 0.0 && now - data.last_mood_change_time >= options_.mood_decay_interval) {
        if (data.mood > 0.0) {
            data.mood = std::max(0.0, data.mood - options_.mood_decay_step);
        } else {
            data.mood = std::min(0.0, data.mood + options_.mood_decay_step);
        }
        data.last_mood_change_time = now;
        heartcore::session::MarkDirtyLocked(data);
        report.mood_decayed += 1;
        heartcore::utils::LogDebug("decay", "mood decayed", {
            {"session", data.session_id}, {"mood", std::to_string(data.mood)}});
    }
}

bool StateDecayScheduler::WantsWake(
    const heartcore::session::SessionData& data,
    heartcore::utils::TimePoint now) const {
    if (!options_.proactive_enabled || !on_wake_ || data.locked || data.load_pending) {
        return false;
    }
    // a session that never got a reply has no conversation to resume
    if (!data.last_reply_time.has_value()) {
        return false;
    }
    if (last_wake_.has_value() && now - *last_wake_ < options_.proactive_cooldown) {
        return false;
    }
    return data.energy > options_.proactive_energy_threshold &&
           now - *data.last_reply_time > options_.proactive_silence;
}

TickReport StateDecayScheduler::TickNow() {
    TickReport report{};
    const auto now = store_.Now();
    for (const auto& id : store_.SessionIds()) {
        report.sessions += 1;
        bool idle_past_ttl = false;
        bool dirty = false;
        {
            auto session = store_.Find(id);
            if (!session) {
                continue;
            }
            bool wake = false;
            session->WithData([&](heartcore::session::SessionData& data) {
                Decay(data, now, report);
                wake = WantsWake(data, now);
                idle_past_ttl = now - data.last_access_time >= options_.eviction_ttl;
                dirty = data.dirty;
            });
            if (wake && on_wake_(session)) {
                last_wake_ = now;
                report.proactive += 1;
                idle_past_ttl = false;
                heartcore::utils::LogInfo("decay", "proactive wake-up", {{"session", id}});
            }
        }
        // The reference above is released so eviction sees only the cache's.
        if (dirty) {
            if (store_.Flush(id)) {
                report.flushed += 1;
            } else {
                report.flush_failed += 1;
            }
        }
        if (idle_past_ttl && store_.EvictIfIdle(id, options_.eviction_ttl)) {
            report.evicted += 1;
        }
    }
    if (report.flush_failed > 0 || report.evicted > 0) {
        heartcore::utils::LogInfo("decay", "tick", {
            {"sessions", std::to_string(report.sessions)},
            {"flushed", std::to_string(report.flushed)},
            {"flush_failed", std::to_string(report.flush_failed)},
            {"evicted", std::to_string(report.evicted)}});
    }
    return report;
}

}  // namespace heartcore::heartbeat
