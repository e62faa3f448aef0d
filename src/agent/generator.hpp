#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "bus/events.hpp"
#include "session/session_types.hpp"

namespace heartcore::agent {

struct GenerationResult {
    std::string reply_text;
    double sentiment_delta = 0.0;
};

class GeneratorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Produces one reply for an ordered batch. An empty batch asks for an
// unprompted opener. Called on a scheduler worker; throws GeneratorError
// (or any std::exception) on failure.
class Generator {
public:
    virtual ~Generator() = default;
    virtual GenerationResult Generate(
        const std::string& session_id,
        const heartcore::session::SessionSnapshot& state,
        const std::vector<heartcore::bus::InboundMessage>& batch,
        const std::vector<heartcore::bus::InboundMessage>& ambient_context) = 0;
};

}  // namespace heartcore::agent
