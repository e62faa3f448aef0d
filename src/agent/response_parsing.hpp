#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace heartcore::agent {

// Pulls the first JSON object out of a model reply, tolerating ```json
// fences and leading prose.
std::optional<nlohmann::json> ExtractJsonObject(const std::string& text);

std::string Trim(const std::string& value);
std::string ToLower(std::string value);

}  // namespace heartcore::agent
