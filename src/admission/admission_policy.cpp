#include "admission/admission_policy.hpp"

#include <exception>
#include <utility>

#include "agent/response_parsing.hpp"
#include "utils/logging.hpp"

namespace heartcore::admission {

using heartcore::agent::Action;
using heartcore::agent::Decision;

AdmissionOptions MakeAdmissionOptions(const heartcore::config::Config& config) {
    AdmissionOptions options{};
    options.energy_floor = config.energy.floor;
    options.wakeup_words = config.attention.wakeup_words;
    options.failure_default = config.classifier.failure_default;
    return options;
}

Action ToAction(heartcore::config::DecisionDefault value) {
    switch (value) {
        case heartcore::config::DecisionDefault::kReply: return Action::kReply;
        case heartcore::config::DecisionDefault::kWait: return Action::kWait;
        case heartcore::config::DecisionDefault::kIgnore: return Action::kIgnore;
    }
    return Action::kIgnore;
}

AdmissionPolicy::AdmissionPolicy(heartcore::agent::Classifier& classifier, AdmissionOptions options)
    : classifier_(classifier)
    , options_(std::move(options)) {}

const std::string* AdmissionPolicy::MatchWakeupWord(const std::string& text) const {
    const auto lowered = heartcore::agent::ToLower(heartcore::agent::Trim(text));
    for (const auto& word : options_.wakeup_words) {
        const auto needle = heartcore::agent::ToLower(heartcore::agent::Trim(word));
        if (!needle.empty() && lowered.rfind(needle, 0) == 0) {
            return &word;
        }
    }
    return nullptr;
}

Decision AdmissionPolicy::Decide(
    const heartcore::session::SessionState& session,
    const heartcore::bus::InboundMessage& msg) {
    const auto [energy, mood] = session.WithData([](const heartcore::session::SessionData& data) {
        return std::make_pair(data.energy, data.mood);
    });

    if (energy < options_.energy_floor && !msg.wake_signal) {
        heartcore::utils::LogDebug("admission", "energy below floor, ignoring", {
            {"session", msg.session_id}, {"energy", std::to_string(energy)}});
        return Decision{.action = Action::kIgnore, .necessity = 0, .thought = "exhausted"};
    }

    if (msg.wake_signal) {
        heartcore::utils::LogDebug("admission", "wake signal", {{"session", msg.session_id}});
        return Decision{.action = Action::kReply, .relevance = 10, .necessity = 10, .thought = "woken"};
    }

    if (const auto* word = MatchWakeupWord(msg.text)) {
        heartcore::utils::LogDebug("admission", "wakeup word", {{"session", msg.session_id}, {"word", *word}});
        return Decision{.action = Action::kReply, .relevance = 10, .necessity = 9, .thought = "wakeup word " + *word};
    }

    try {
        return classifier_.Classify(msg.session_id, mood, msg.text);
    } catch (const std::exception& ex) {
        const auto fallback = ToAction(options_.failure_default);
        heartcore::utils::LogWarn("admission", "classifier failed, using default", {
            {"session", msg.session_id},
            {"default", heartcore::agent::ToString(fallback)},
            {"error", ex.what()}});
        return Decision{.action = fallback, .thought = "classifier unavailable"};
    }
}

}  // namespace heartcore::admission
