#include "providers/llm_provider.hpp"

#include "providers/openai_provider.hpp"

namespace heartcore::providers {

ProviderSettings ResolveProviderSettings(const heartcore::config::ProviderConfig& config) {
    ProviderSettings settings{};
    settings.api_key = config.api_key;
    settings.api_base = config.api_base.empty() ? "https://api.openai.com/v1" : config.api_base;
    settings.model = config.model.empty() ? "gpt-4o-mini" : config.model;
    settings.timeout_s = config.timeout_s > 0 ? config.timeout_s : 60;
    settings.use_proxy_for_llm = config.use_proxy;
    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(const heartcore::config::ProviderConfig& config) {
    return std::make_unique<OpenAIProvider>(ResolveProviderSettings(config));
}

}  // namespace heartcore::providers
