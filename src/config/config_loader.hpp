#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace heartcore::config {

Config LoadConfig();
Config LoadConfigFrom(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);
void Validate(Config& config);

std::string ExpandHome(const std::string& path);
DecisionDefault ParseDecisionDefault(const std::string& value, DecisionDefault fallback);
const char* ToString(DecisionDefault value);

}  // namespace heartcore::config
