#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"

namespace heartcore::providers {

struct Message {
    std::string role;
    std::string content;
    std::string name;
};

struct LLMResponse {
    std::string content;
    std::string finish_reason = "stop";
    std::unordered_map<std::string, int> usage;

    bool IsError() const { return finish_reason == "error"; }
};

struct ProviderSettings {
    std::string api_key;
    std::string api_base;
    std::string model;
    int timeout_s = 60;
    bool use_proxy_for_llm = false;
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    virtual LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) = 0;
    virtual std::string GetDefaultModel() const = 0;
};

ProviderSettings ResolveProviderSettings(const heartcore::config::ProviderConfig& config);
std::unique_ptr<LLMProvider> CreateProvider(const heartcore::config::ProviderConfig& config);

}  // namespace heartcore::providers
