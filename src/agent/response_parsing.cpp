#include "agent/response_parsing.hpp"

#include <algorithm>
#include <cctype>

#include "agent/classifier.hpp"

namespace heartcore::agent {

std::string Trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::optional<nlohmann::json> ExtractJsonObject(const std::string& text) {
    auto working = Trim(text);
    if (working.rfind("```", 0) == 0) {
        const auto first_newline = working.find('\n');
        const auto closing = working.rfind("```");
        if (first_newline != std::string::npos && closing > first_newline) {
            working = working.substr(first_newline + 1, closing - first_newline - 1);
        }
    }
    const auto open = working.find('{');
    const auto close = working.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }
    auto json = nlohmann::json::parse(working.substr(open, close - open + 1), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    return json;
}

std::optional<Action> ParseAction(const std::string& value) {
    const auto lower = ToLower(Trim(value));
    if (lower == "reply") {
        return Action::kReply;
    }
    if (lower == "wait") {
        return Action::kWait;
    }
    if (lower == "ignore") {
        return Action::kIgnore;
    }
    return std::nullopt;
}

}  // namespace heartcore::agent
