#include "agent/llm_classifier.hpp"

#include <cstdio>
#include <vector>

#include "agent/response_parsing.hpp"
#include "utils/logging.hpp"

namespace heartcore::agent {
namespace {

int ReadScore(const nlohmann::json& json, const char* key) {
    if (!json.contains(key)) {
        return 0;
    }
    const auto& value = json[key];
    if (value.is_number()) {
        return static_cast<int>(value.get<double>());
    }
    if (value.is_string()) {
        try {
            return std::stoi(value.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

}  // namespace

LlmClassifier::LlmClassifier(heartcore::providers::LLMProvider& provider, heartcore::config::ClassifierConfig config)
    : provider_(provider)
    , config_(std::move(config)) {}

std::string LlmClassifier::BuildPrompt(double mood, const std::string& text) {
    char mood_text[16];
    std::snprintf(mood_text, sizeof(mood_text), "%.2f", mood);
    std::string prompt;
    prompt.append("You judge the intent of a group chat message. Current group mood: ");
    prompt.append(mood_text);
    prompt.append(" (-1.0 to 1.0).\n");
    prompt.append("Message: \"").append(text).append("\"\n\n");
    prompt.append(
        "Decide the assistant's action:\n"
        "- REPLY: an explicit question, or a topic directly relevant to you; answer now.\n"
        "- WAIT: the sender seems unfinished (a fragment or half sentence); wait for more.\n"
        "- IGNORE: idle chatter or spam that does not address you.\n\n"
        "Return strictly JSON: {\"action\": \"REPLY\"|\"WAIT\"|\"IGNORE\", "
        "\"relevance\": int(1-10), \"necessity\": int(1-10)}");
    return prompt;
}

Decision LlmClassifier::ParseDecision(const std::string& content) {
    const auto json = ExtractJsonObject(content);
    if (!json.has_value()) {
        throw ClassifierError("classifier reply is not JSON");
    }
    Decision decision{};
    const auto action = ParseAction(json->value("action", std::string("IGNORE")));
    decision.action = action.value_or(Action::kIgnore);
    decision.relevance = ReadScore(*json, "relevance");
    decision.necessity = ReadScore(*json, "necessity");
    decision.thought = json->value("thought", std::string());
    return decision;
}

Decision LlmClassifier::Classify(const std::string& session_id, double mood, const std::string& text) {
    const std::vector<heartcore::providers::Message> messages{
        {.role = "user", .content = BuildPrompt(mood, text)}};
    const auto model = config_.model.empty() ? provider_.GetDefaultModel() : config_.model;
    const auto response = provider_.Chat(messages, model, config_.max_tokens, config_.temperature);
    if (response.IsError()) {
        throw ClassifierError("classifier call failed: " + response.content);
    }
    auto decision = ParseDecision(response.content);
    heartcore::utils::LogDebug("admission", "classified", {
        {"session", session_id},
        {"action", ToString(decision.action)},
        {"necessity", std::to_string(decision.necessity)}});
    return decision;
}

}  // namespace heartcore::agent
