#pragma once

#include <string>
#include <vector>

#include "agent/classifier.hpp"
#include "bus/events.hpp"
#include "config/config_schema.hpp"
#include "session/session_state.hpp"

namespace heartcore::admission {

struct AdmissionOptions {
    double energy_floor = 0.1;
    std::vector<std::string> wakeup_words;
    heartcore::config::DecisionDefault failure_default = heartcore::config::DecisionDefault::kIgnore;
};

AdmissionOptions MakeAdmissionOptions(const heartcore::config::Config& config);
heartcore::agent::Action ToAction(heartcore::config::DecisionDefault value);

// Turns one message into REPLY/WAIT/IGNORE. Reads the session but never
// mutates it and never holds its mutex across the classifier call.
class AdmissionPolicy {
public:
    AdmissionPolicy(heartcore::agent::Classifier& classifier, AdmissionOptions options);

    heartcore::agent::Decision Decide(
        const heartcore::session::SessionState& session,
        const heartcore::bus::InboundMessage& msg);

private:
    const std::string* MatchWakeupWord(const std::string& text) const;

    heartcore::agent::Classifier& classifier_;
    AdmissionOptions options_;
};

}  // namespace heartcore::admission
