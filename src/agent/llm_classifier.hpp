#pragma once

#include <string>

#include "agent/classifier.hpp"
#include "config/config_schema.hpp"
#include "providers/llm_provider.hpp"

namespace heartcore::agent {

class LlmClassifier : public Classifier {
public:
    LlmClassifier(heartcore::providers::LLMProvider& provider, heartcore::config::ClassifierConfig config);

    Decision Classify(const std::string& session_id, double mood, const std::string& text) override;

    static std::string BuildPrompt(double mood, const std::string& text);
    // Throws ClassifierError when no JSON object can be found.
    static Decision ParseDecision(const std::string& content);

private:
    heartcore::providers::LLMProvider& provider_;
    heartcore::config::ClassifierConfig config_;
};

}  // namespace heartcore::agent
