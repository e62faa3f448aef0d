#include "dispatch/debounce_aggregator.hpp"

#include <exception>
#include <optional>
#include <utility>

#include "utils/logging.hpp"

namespace heartcore::dispatch {

DebounceOptions MakeDebounceOptions(const heartcore::config::Config& config) {
    DebounceOptions options{};
    options.quiet_period = std::chrono::milliseconds(
        static_cast<std::int64_t>(config.debounce.quiet_period_s * 1000.0));
    options.max_window = std::chrono::milliseconds(
        static_cast<std::int64_t>(config.debounce.max_window_s * 1000.0));
    options.energy_cost = config.energy.cost_per_cycle;
    return options;
}

DebounceAggregator::DebounceAggregator(
    heartcore::session::SessionStateStore& store,
    heartcore::scheduler::TaskScheduler& timers,
    heartcore::scheduler::TaskScheduler& workers,
    heartcore::agent::Generator& generator,
    DebounceOptions options,
    ReplySink sink)
    : store_(store)
    , timers_(timers)
    , workers_(workers)
    , generator_(generator)
    , options_(options)
    , sink_(std::move(sink)) {}

void DebounceAggregator::Open(SessionPtr session, std::uint64_t cycle_id) {
    heartcore::utils::LogDebug("debounce", "window opened", {
        {"session", session->Id()}, {"cycle", std::to_string(cycle_id)}});
    timers_.Post([this, session = std::move(session), cycle_id]() {
        CheckWindow(session, cycle_id);
    });
}

bool DebounceAggregator::OpenProactive(SessionPtr session) {
    auto closing = session->BeginProactive(timers_.Now());
    if (!closing.has_value()) {
        return false;
    }
    heartcore::utils::LogInfo("debounce", "proactive cycle opened", {
        {"session", session->Id()}, {"cycle", std::to_string(closing->cycle_id)}});
    workers_.Post([this, session = std::move(session), closing = std::move(*closing)]() mutable {
        RunCycle(std::move(session), std::move(closing));
    });
    return true;
}

void DebounceAggregator::CheckWindow(SessionPtr session, std::uint64_t cycle_id) {
    const auto deadline = session->WindowDeadline(cycle_id, options_.quiet_period, options_.max_window);
    if (!deadline.has_value()) {
        return;
    }
    // Owner appends only push the quiet deadline later, so re-posting at
    // the recomputed deadline is the re-arm.
    if (timers_.Now() < *deadline) {
        timers_.PostAt(*deadline, [this, session, cycle_id]() {
            CheckWindow(session, cycle_id);
        });
        return;
    }
    // Closing happens here so later owner messages are deferred from the
    // deadline on, not from whenever a worker picks the cycle up.
    auto closing = session->BeginClosing(cycle_id);
    if (!closing.has_value()) {
        return;
    }
    heartcore::utils::LogInfo("debounce", "window closed", {
        {"session", session->Id()},
        {"cycle", std::to_string(cycle_id)},
        {"batch", std::to_string(closing->batch.size())}});
    workers_.Post([this, session = std::move(session), closing = std::move(*closing)]() mutable {
        RunCycle(std::move(session), std::move(closing));
    });
}

void DebounceAggregator::RunCycle(SessionPtr session, heartcore::session::ClosingBatch closing) {
    const auto& session_id = session->Id();
    const auto cycle_id = closing.cycle_id;

    heartcore::session::CycleDelta delta{};
    delta.energy_cost = options_.energy_cost;
    std::optional<heartcore::agent::GenerationResult> result;
    try {
        auto snapshot = session->Snapshot();
        snapshot.energy = closing.energy;
        snapshot.mood = closing.mood;
        result = generator_.Generate(session_id, snapshot, closing.batch, closing.ambient_context);
    } catch (const std::exception& ex) {
        failed_cycles_ += 1;
        heartcore::utils::LogWarn("debounce", "generation failed", {
            {"session", session_id}, {"cycle", std::to_string(cycle_id)}, {"error", ex.what()}});
    }

    if (result.has_value()) {
        delta.success = true;
        // a proactive opener starts the conversation from a neutral mood
        delta.mood_delta = closing.proactive ? -closing.mood : result->sentiment_delta;
        if (sink_ && !result->reply_text.empty()) {
            heartcore::bus::OutboundMessage outbound{};
            outbound.session_id = session_id;
            outbound.content = result->reply_text;
            if (!closing.batch.empty()) {
                outbound.reply_to = closing.batch.back().sender_id;
            }
            outbound.metadata["cycle_id"] = std::to_string(cycle_id);
            if (closing.proactive) {
                outbound.metadata["proactive"] = "true";
            }
            sink_(outbound);
        }
    }

    store_.ApplyCycleDelta(*session, delta);
    completed_cycles_ += 1;

    auto handoff = session->FinishCycle(cycle_id, timers_.Now());
    if (!handoff.has_value()) {
        heartcore::utils::LogDebug("debounce", "lock released", {{"session", session_id}});
        return;
    }
    heartcore::utils::LogInfo("debounce", "background promoted", {
        {"session", session_id},
        {"cycle", std::to_string(handoff->cycle_id)},
        {"owner", handoff->owner_sender_id},
        {"batch", std::to_string(handoff->batch_size)}});
    Open(std::move(session), handoff->cycle_id);
}

}  // namespace heartcore::dispatch
