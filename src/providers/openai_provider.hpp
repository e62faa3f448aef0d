#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace heartcore::providers {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url);
bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port);
std::string MaskKey(const std::string& key);

// OpenAI-compatible chat/completions client.
class OpenAIProvider : public LLMProvider {
public:
    explicit OpenAIProvider(ProviderSettings settings);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return settings_.model; }

private:
    ProviderSettings settings_;
};

}  // namespace heartcore::providers
