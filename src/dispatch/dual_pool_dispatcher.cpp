#include "dispatch/dual_pool_dispatcher.hpp"

#include "utils/logging.hpp"

namespace heartcore::dispatch {

using heartcore::session::Admission;

DispatcherOptions MakeDispatcherOptions(const heartcore::config::Config& config) {
    DispatcherOptions options{};
    options.background_capacity = static_cast<std::size_t>(config.attention.background_pool_capacity);
    options.ambient_capacity = static_cast<std::size_t>(config.attention.ambient_context_capacity);
    return options;
}

DualPoolDispatcher::DualPoolDispatcher(
    heartcore::session::SessionStateStore& store,
    heartcore::admission::AdmissionPolicy& policy,
    DebounceAggregator& aggregator,
    DispatcherOptions options)
    : store_(store)
    , policy_(policy)
    , aggregator_(aggregator)
    , options_(options) {}

DispatchResult DualPoolDispatcher::OnMessage(const heartcore::bus::InboundMessage& msg) {
    auto session = store_.Get(msg.session_id);

    DispatchResult result{};
    result.decision = policy_.Decide(*session, msg);
    if (result.decision.action == heartcore::agent::Action::kIgnore) {
        session->AppendAmbient(msg, options_.ambient_capacity);
        heartcore::utils::LogDebug("dispatcher", "ignored", {
            {"session", msg.session_id}, {"sender", msg.sender_id}});
        return result;
    }

    const auto admitted = session->Admit(msg, options_.background_capacity, store_.Now());
    result.admission = admitted.admission;
    result.cycle_id = admitted.cycle_id;
    if (admitted.dropped > 0) {
        dropped_ += admitted.dropped;
        heartcore::utils::LogWarn("dispatcher", "background pool full, dropped oldest", {
            {"session", msg.session_id}, {"dropped", std::to_string(admitted.dropped)}});
    }

    switch (admitted.admission) {
        case Admission::kOpenedCycle:
            heartcore::utils::LogInfo("dispatcher", "cycle opened", {
                {"session", msg.session_id},
                {"owner", msg.sender_id},
                {"cycle", std::to_string(admitted.cycle_id)},
                {"action", heartcore::agent::ToString(result.decision.action)}});
            aggregator_.Open(session, admitted.cycle_id);
            break;
        case Admission::kExtendedCycle:
            heartcore::utils::LogDebug("dispatcher", "window extended", {
                {"session", msg.session_id}, {"cycle", std::to_string(admitted.cycle_id)}});
            break;
        case Admission::kDeferred:
            heartcore::utils::LogDebug("dispatcher", "deferred to background", {
                {"session", msg.session_id}, {"sender", msg.sender_id}});
            break;
    }
    return result;
}

}  // namespace heartcore::dispatch
