#include "agent/llm_generator.hpp"

#include <cstdio>
#include <sstream>

#include "agent/response_parsing.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace heartcore::agent {
namespace {

std::string SpeakerOf(const heartcore::bus::InboundMessage& msg) {
    return msg.sender_name.empty() ? msg.sender_id : msg.sender_name;
}

void AppendLines(std::ostringstream& out, const std::vector<heartcore::bus::InboundMessage>& messages) {
    for (const auto& msg : messages) {
        out << "[" << heartcore::utils::FormatLocalTime(msg.arrival_time, "%H:%M:%S") << "] "
            << SpeakerOf(msg) << ": " << msg.text;
        if (!msg.attachment_refs.empty()) {
            out << " (attachments: " << heartcore::utils::Join(msg.attachment_refs, ", ") << ")";
        }
        out << "\n";
    }
}

}  // namespace

LlmGenerator::LlmGenerator(heartcore::providers::LLMProvider& provider, heartcore::config::GeneratorConfig config)
    : provider_(provider)
    , config_(std::move(config)) {}

std::vector<heartcore::providers::Message> LlmGenerator::BuildMessages(
    const heartcore::session::SessionSnapshot& state,
    const std::vector<heartcore::bus::InboundMessage>& batch,
    const std::vector<heartcore::bus::InboundMessage>& ambient_context) const {
    char state_line[96];
    std::snprintf(state_line, sizeof(state_line), "Energy: %.2f (0 to 1). Mood: %.2f (-1 to 1).",
                  state.energy, state.mood);

    const bool opener = batch.empty();
    std::ostringstream system;
    system << config_.persona << "\n\n"
           << "## Current state\n" << state_line << "\n\n"
           << (opener ? "The chat has been quiet for a long time. Start a new topic in one short, natural "
                        "chat message, the way a regular member drops back in. Do not mention the silence. "
                      : "Reply to the new messages in one short chat message. ")
           << "Return strictly JSON: "
           << "{\"reply\": string, \"moodDelta\": number between -0.3 and 0.3 describing how the "
           << "conversation shifts your mood}";

    std::ostringstream user;
    if (!ambient_context.empty()) {
        user << "## Recent chatter (context only)\n";
        AppendLines(user, ambient_context);
        user << "\n";
    }
    if (opener) {
        user << "## New messages\n(none)\n";
    } else {
        user << "## New messages\n";
        AppendLines(user, batch);
    }

    return {
        {.role = "system", .content = system.str()},
        {.role = "user", .content = user.str()}};
}

GenerationResult LlmGenerator::ParseGeneration(const std::string& content) {
    GenerationResult result{};
    const auto json = ExtractJsonObject(content);
    if (json.has_value() && json->contains("reply") && (*json)["reply"].is_string()) {
        result.reply_text = Trim((*json)["reply"].get<std::string>());
        if (json->contains("moodDelta") && (*json)["moodDelta"].is_number()) {
            result.sentiment_delta = heartcore::utils::Clamp((*json)["moodDelta"].get<double>(), -1.0, 1.0);
        }
    } else {
        result.reply_text = Trim(content);
    }
    if (result.reply_text.empty()) {
        throw GeneratorError("generator returned an empty reply");
    }
    return result;
}

GenerationResult LlmGenerator::Generate(
    const std::string& session_id,
    const heartcore::session::SessionSnapshot& state,
    const std::vector<heartcore::bus::InboundMessage>& batch,
    const std::vector<heartcore::bus::InboundMessage>& ambient_context) {
    const auto model = config_.model.empty() ? provider_.GetDefaultModel() : config_.model;
    const auto response = provider_.Chat(
        BuildMessages(state, batch, ambient_context), model, config_.max_tokens, config_.temperature);
    if (response.IsError()) {
        throw GeneratorError("generator call failed: " + response.content);
    }
    auto result = ParseGeneration(response.content);
    heartcore::utils::LogDebug("llm", "reply generated", {
        {"session", session_id},
        {"batch", std::to_string(batch.size())},
        {"mood_delta", std::to_string(result.sentiment_delta)}});
    return result;
}

}  // namespace heartcore::agent
