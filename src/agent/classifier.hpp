#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace heartcore::agent {

enum class Action {
    kReply,
    kWait,
    kIgnore
};

inline const char* ToString(Action action) {
    switch (action) {
        case Action::kReply: return "REPLY";
        case Action::kWait: return "WAIT";
        case Action::kIgnore: return "IGNORE";
    }
    return "IGNORE";
}

// Case-insensitive; nullopt for anything else.
std::optional<Action> ParseAction(const std::string& value);

struct Decision {
    Action action = Action::kIgnore;
    int relevance = 0;
    int necessity = 0;
    std::string thought;
};

class ClassifierError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Intent judge. May be slow; throws ClassifierError when unavailable.
class Classifier {
public:
    virtual ~Classifier() = default;
    virtual Decision Classify(const std::string& session_id, double mood, const std::string& text) = 0;
};

}  // namespace heartcore::agent
