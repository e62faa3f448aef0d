#pragma once

#include <string>
#include <vector>

#include "agent/generator.hpp"
#include "config/config_schema.hpp"
#include "providers/llm_provider.hpp"

namespace heartcore::agent {

class LlmGenerator : public Generator {
public:
    LlmGenerator(heartcore::providers::LLMProvider& provider, heartcore::config::GeneratorConfig config);

    GenerationResult Generate(
        const std::string& session_id,
        const heartcore::session::SessionSnapshot& state,
        const std::vector<heartcore::bus::InboundMessage>& batch,
        const std::vector<heartcore::bus::InboundMessage>& ambient_context) override;

    std::vector<heartcore::providers::Message> BuildMessages(
        const heartcore::session::SessionSnapshot& state,
        const std::vector<heartcore::bus::InboundMessage>& batch,
        const std::vector<heartcore::bus::InboundMessage>& ambient_context) const;

    // {"reply","moodDelta"} or plain text with a zero delta. Throws
    // GeneratorError on an empty reply.
    static GenerationResult ParseGeneration(const std::string& content);

private:
    heartcore::providers::LLMProvider& provider_;
    heartcore::config::GeneratorConfig config_;
};

}  // namespace heartcore::agent
