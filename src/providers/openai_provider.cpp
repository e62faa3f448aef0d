#include "providers/openai_provider.hpp"

#include <cstdlib>
#include <memory>
#include <string>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace heartcore::providers {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

void ApplyProxyFromEnv(httplib::Client& client) {
    std::string proxy_host;
    int proxy_port = 0;
    for (const char* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
        const auto value = GetEnv(name);
        if (!value.empty() && ParseProxyHostPort(value, proxy_host, proxy_port)) {
            client.set_proxy(proxy_host, proxy_port);
            return;
        }
    }
    if (!GetEnv("ALL_PROXY").empty() || !GetEnv("all_proxy").empty()) {
        heartcore::utils::LogWarn("llm", "ALL_PROXY is set but cpp-httplib only supports HTTP proxy");
    }
}

}  // namespace

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            heartcore::utils::LogWarn("llm", "invalid port in api base", {{"url", url}});
        }
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

OpenAIProvider::OpenAIProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {}

LLMResponse OpenAIProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    try {
        const auto chosen_model = model.empty() ? settings_.model : model;

        nlohmann::json payload;
        payload["model"] = chosen_model;
        payload["max_tokens"] = max_tokens;
        payload["temperature"] = temperature;
        payload["messages"] = nlohmann::json::array();
        for (const auto& msg : messages) {
            nlohmann::json entry;
            entry["role"] = msg.role;
            entry["content"] = msg.content;
            if (!msg.name.empty()) {
                entry["name"] = msg.name;
            }
            payload["messages"].push_back(entry);
        }

        const auto parsed = ParseUrl(settings_.api_base);
        const std::string endpoint = parsed.base_path + "/chat/completions";
        std::string scheme_host_port = parsed.https ? "https://" : "http://";
        scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);

        auto client = std::make_unique<httplib::Client>(scheme_host_port);
        client->set_connection_timeout(settings_.timeout_s);
        client->set_read_timeout(settings_.timeout_s);
        if (settings_.use_proxy_for_llm) {
            ApplyProxyFromEnv(*client);
        }

        heartcore::utils::LogDebug("llm", "POST " + scheme_host_port + endpoint, {
            {"model", chosen_model}, {"api_key", MaskKey(settings_.api_key)}});

        httplib::Headers headers{{"Content-Type", "application/json"}};
        if (!settings_.api_key.empty()) {
            headers.emplace("Authorization", "Bearer " + settings_.api_key);
        }

        auto response = client->Post(endpoint.c_str(), headers, payload.dump(), "application/json");
        if (!response) {
            const auto err = response.error();
            const auto err_text = httplib::to_string(err);
            heartcore::utils::LogWarn("llm", "request failed", {
                {"httplib_error", std::to_string(static_cast<int>(err))}, {"detail", err_text}});
            return LLMResponse{
                .content = "request failed (" + err_text + ")",
                .finish_reason = "error"};
        }
        if (response->status >= 400) {
            heartcore::utils::LogWarn("llm", "HTTP error", {
                {"status", std::to_string(response->status)}, {"body", response->body}});
            return LLMResponse{
                .content = "HTTP " + std::to_string(response->status),
                .finish_reason = "error"};
        }

        auto json = nlohmann::json::parse(response->body, nullptr, false);
        if (json.is_discarded() || !json.contains("choices") || json["choices"].empty()) {
            return LLMResponse{.content = "invalid response", .finish_reason = "error"};
        }

        LLMResponse parsed_response{};
        const auto& choice = json["choices"][0];
        if (choice.contains("message")) {
            const auto& message = choice["message"];
            if (message.contains("content") && message["content"].is_string()) {
                parsed_response.content = message["content"].get<std::string>();
            }
        }
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
            parsed_response.finish_reason = choice["finish_reason"].get<std::string>();
        }
        if (json.contains("usage") && json["usage"].is_object()) {
            for (const auto* key : {"prompt_tokens", "completion_tokens", "total_tokens"}) {
                if (json["usage"].contains(key) && json["usage"][key].is_number_integer()) {
                    parsed_response.usage[key] = json["usage"][key].get<int>();
                }
            }
        }
        return parsed_response;
    } catch (const std::exception& ex) {
        return LLMResponse{
            .content = ex.what(),
            .finish_reason = "error"};
    }
}

}  // namespace heartcore::providers
