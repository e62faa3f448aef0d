#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "admission/admission_policy.hpp"
#include "bus/events.hpp"
#include "config/config_schema.hpp"
#include "dispatch/debounce_aggregator.hpp"
#include "session/session_state_store.hpp"

namespace heartcore::dispatch {

struct DispatcherOptions {
    std::size_t background_capacity = 20;
    std::size_t ambient_capacity = 20;
};

DispatcherOptions MakeDispatcherOptions(const heartcore::config::Config& config);

struct DispatchResult {
    heartcore::agent::Decision decision;
    // Unset for IGNORE.
    std::optional<heartcore::session::Admission> admission;
    std::uint64_t cycle_id = 0;
};

// Routes each admitted message into the owning session's accumulation pool,
// a freshly opened cycle, or the background pool.
class DualPoolDispatcher {
public:
    DualPoolDispatcher(
        heartcore::session::SessionStateStore& store,
        heartcore::admission::AdmissionPolicy& policy,
        DebounceAggregator& aggregator,
        DispatcherOptions options);

    DispatchResult OnMessage(const heartcore::bus::InboundMessage& msg);

    std::uint64_t DroppedCount() const { return dropped_.load(); }

private:
    heartcore::session::SessionStateStore& store_;
    heartcore::admission::AdmissionPolicy& policy_;
    DebounceAggregator& aggregator_;
    DispatcherOptions options_;
    std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace heartcore::dispatch
