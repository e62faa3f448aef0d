#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "utils/logging.hpp"

namespace heartcore::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto overridden = GetEnv("HEARTCORE_CONFIG");
    if (!overridden.empty()) {
        return std::filesystem::path(ExpandHome(overridden));
    }
    return GetHomePath() / ".heartcore" / "config.json";
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool ParseBool(const std::string& value) {
    const auto lowered = ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ReadDouble(const nlohmann::json& obj, const char* key, double& target) {
    if (obj.contains(key) && obj[key].is_number()) {
        target = obj[key].get<double>();
    }
}

void ReadInt(const nlohmann::json& obj, const char* key, int& target) {
    if (obj.contains(key) && obj[key].is_number_integer()) {
        target = obj[key].get<int>();
    }
}

void ReadString(const nlohmann::json& obj, const char* key, std::string& target) {
    if (obj.contains(key) && obj[key].is_string()) {
        target = obj[key].get<std::string>();
    }
}

void ReadBool(const nlohmann::json& obj, const char* key, bool& target) {
    if (obj.contains(key) && obj[key].is_boolean()) {
        target = obj[key].get<bool>();
    }
}

void ReadStringList(const nlohmann::json& obj, const char* key, std::vector<std::string>& target) {
    if (!obj.contains(key) || !obj[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : obj[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

void ReadDecisionDefault(const nlohmann::json& obj, const char* key, DecisionDefault& target) {
    if (obj.contains(key) && obj[key].is_string()) {
        target = ParseDecisionDefault(obj[key].get<std::string>(), target);
    }
}

const nlohmann::json* Section(const nlohmann::json& data, const char* name) {
    if (data.contains(name) && data[name].is_object()) {
        return &data[name];
    }
    return nullptr;
}

// Flat option names as documented for the scheduler core; they sit at the
// top level of the file and win over the nested sections.
void ApplyFlatOptions(Config& config, const nlohmann::json& data) {
    ReadDouble(data, "energyFloor", config.energy.floor);
    ReadDouble(data, "energyCostPerCycle", config.energy.cost_per_cycle);
    ReadDouble(data, "energyDailyRecovery", config.energy.daily_recovery);
    ReadInt(data, "energyRecoverySilenceMinutes", config.energy.recovery_silence_minutes);
    ReadInt(data, "moodDecayIntervalSeconds", config.mood.decay_interval_s);
    ReadDouble(data, "moodDecayStep", config.mood.decay_step);
    ReadDouble(data, "debounceQuietPeriodSeconds", config.debounce.quiet_period_s);
    ReadDouble(data, "debounceMaxWindowSeconds", config.debounce.max_window_s);
    ReadInt(data, "backgroundPoolCapacity", config.attention.background_pool_capacity);
    ReadInt(data, "evictionTtlSeconds", config.cache.eviction_ttl_s);
    ReadBool(data, "proactiveEnabled", config.proactive.enabled);
    ReadDouble(data, "proactiveEnergyThreshold", config.proactive.energy_threshold);
    ReadInt(data, "proactiveSilenceThresholdMinutes", config.proactive.silence_threshold_minutes);
    ReadInt(data, "proactiveGlobalCooldownSeconds", config.proactive.global_cooldown_s);
    ReadDecisionDefault(data, "classifierFailureDefault", config.classifier.failure_default);
}

}  // namespace

std::string ExpandHome(const std::string& path) {
    if (path.rfind("~/", 0) == 0) {
        return (GetHomePath() / path.substr(2)).string();
    }
    if (path == "~") {
        return GetHomePath().string();
    }
    return path;
}

DecisionDefault ParseDecisionDefault(const std::string& value, DecisionDefault fallback) {
    const auto lowered = ToLower(value);
    if (lowered == "reply") {
        return DecisionDefault::kReply;
    }
    if (lowered == "wait") {
        return DecisionDefault::kWait;
    }
    if (lowered == "ignore") {
        return DecisionDefault::kIgnore;
    }
    return fallback;
}

const char* ToString(DecisionDefault value) {
    switch (value) {
        case DecisionDefault::kReply: return "REPLY";
        case DecisionDefault::kWait: return "WAIT";
        case DecisionDefault::kIgnore: return "IGNORE";
    }
    return "IGNORE";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (const auto* energy = Section(data, "energy")) {
        ReadDouble(*energy, "initial", config.energy.initial);
        ReadDouble(*energy, "floor", config.energy.floor);
        ReadDouble(*energy, "costPerCycle", config.energy.cost_per_cycle);
        ReadDouble(*energy, "dailyRecovery", config.energy.daily_recovery);
        ReadInt(*energy, "recoverySilenceMinutes", config.energy.recovery_silence_minutes);
        ReadDouble(*energy, "recoveryIncrement", config.energy.recovery_increment);
        ReadDouble(*energy, "recoveryCeiling", config.energy.recovery_ceiling);
    }

    if (const auto* mood = Section(data, "mood")) {
        ReadInt(*mood, "decayIntervalSeconds", config.mood.decay_interval_s);
        ReadDouble(*mood, "decayStep", config.mood.decay_step);
    }

    if (const auto* debounce = Section(data, "debounce")) {
        ReadDouble(*debounce, "quietPeriodSeconds", config.debounce.quiet_period_s);
        ReadDouble(*debounce, "maxWindowSeconds", config.debounce.max_window_s);
    }

    if (const auto* attention = Section(data, "attention")) {
        ReadInt(*attention, "backgroundPoolCapacity", config.attention.background_pool_capacity);
        ReadInt(*attention, "ambientContextCapacity", config.attention.ambient_context_capacity);
        ReadStringList(*attention, "wakeupWords", config.attention.wakeup_words);
    }

    if (const auto* cache = Section(data, "cache")) {
        ReadInt(*cache, "evictionTtlSeconds", config.cache.eviction_ttl_s);
        ReadInt(*cache, "maintenanceIntervalSeconds", config.cache.maintenance_interval_s);
    }

    if (const auto* proactive = Section(data, "proactive")) {
        ReadBool(*proactive, "enabled", config.proactive.enabled);
        ReadDouble(*proactive, "energyThreshold", config.proactive.energy_threshold);
        ReadInt(*proactive, "silenceThresholdMinutes", config.proactive.silence_threshold_minutes);
        ReadInt(*proactive, "globalCooldownSeconds", config.proactive.global_cooldown_s);
    }

    if (const auto* classifier = Section(data, "classifier")) {
        ReadDecisionDefault(*classifier, "failureDefault", config.classifier.failure_default);
        ReadString(*classifier, "model", config.classifier.model);
        ReadInt(*classifier, "maxTokens", config.classifier.max_tokens);
        ReadDouble(*classifier, "temperature", config.classifier.temperature);
    }

    if (const auto* generator = Section(data, "generator")) {
        ReadString(*generator, "model", config.generator.model);
        ReadString(*generator, "persona", config.generator.persona);
        ReadInt(*generator, "maxTokens", config.generator.max_tokens);
        ReadDouble(*generator, "temperature", config.generator.temperature);
    }

    if (const auto* provider = Section(data, "provider")) {
        ReadString(*provider, "apiKey", config.provider.api_key);
        ReadString(*provider, "apiBase", config.provider.api_base);
        ReadString(*provider, "model", config.provider.model);
        ReadInt(*provider, "timeoutSeconds", config.provider.timeout_s);
        ReadBool(*provider, "useProxy", config.provider.use_proxy);
    }

    if (const auto* filter = Section(data, "filter")) {
        ReadStringList(*filter, "botNicknames", config.filter.bot_nicknames);
        ReadStringList(*filter, "commandPrefixes", config.filter.command_prefixes);
        ReadStringList(*filter, "commandWords", config.filter.command_words);
    }

    if (const auto* store = Section(data, "store")) {
        ReadString(*store, "type", config.store.type);
        ReadString(*store, "path", config.store.path);
    }

    if (const auto* gateway = Section(data, "gateway")) {
        ReadString(*gateway, "host", config.gateway.host);
        ReadInt(*gateway, "port", config.gateway.port);
    }

    if (const auto* scheduler = Section(data, "scheduler")) {
        ReadInt(*scheduler, "workerThreads", config.scheduler.worker_threads);
        ReadInt(*scheduler, "timerThreads", config.scheduler.timer_threads);
    }

    if (const auto* logging = Section(data, "logging")) {
        ReadString(*logging, "level", config.logging.level);
    }

    ApplyFlatOptions(config, data);
}

void ApplyEnvOverrides(Config& config) {
    const auto api_key = GetEnvFallback("HEARTCORE_PROVIDER__API_KEY", "HEARTCORE_API_KEY");
    if (!api_key.empty()) {
        config.provider.api_key = api_key;
    }

    const auto api_base = GetEnvFallback("HEARTCORE_PROVIDER__API_BASE", "HEARTCORE_API_BASE");
    if (!api_base.empty()) {
        config.provider.api_base = api_base;
    }

    const auto model = GetEnvFallback("HEARTCORE_PROVIDER__MODEL", "HEARTCORE_MODEL");
    if (!model.empty()) {
        config.provider.model = model;
    }

    const auto use_proxy = GetEnv("HEARTCORE_PROVIDER__USE_PROXY");
    if (!use_proxy.empty()) {
        config.provider.use_proxy = ParseBool(use_proxy);
    }

    const auto energy_floor = GetEnvFallback("HEARTCORE_ENERGY__FLOOR", "HEARTCORE_ENERGY_FLOOR");
    if (!energy_floor.empty()) {
        config.energy.floor = ParseDouble(energy_floor, config.energy.floor);
    }

    const auto energy_cost = GetEnvFallback("HEARTCORE_ENERGY__COST_PER_CYCLE", "HEARTCORE_ENERGY_COST_PER_CYCLE");
    if (!energy_cost.empty()) {
        config.energy.cost_per_cycle = ParseDouble(energy_cost, config.energy.cost_per_cycle);
    }

    const auto quiet = GetEnvFallback(
        "HEARTCORE_DEBOUNCE__QUIET_PERIOD_SECONDS",
        "HEARTCORE_DEBOUNCE_QUIET_PERIOD_SECONDS");
    if (!quiet.empty()) {
        config.debounce.quiet_period_s = ParseDouble(quiet, config.debounce.quiet_period_s);
    }

    const auto max_window = GetEnvFallback(
        "HEARTCORE_DEBOUNCE__MAX_WINDOW_SECONDS",
        "HEARTCORE_DEBOUNCE_MAX_WINDOW_SECONDS");
    if (!max_window.empty()) {
        config.debounce.max_window_s = ParseDouble(max_window, config.debounce.max_window_s);
    }

    const auto failure_default = GetEnvFallback(
        "HEARTCORE_CLASSIFIER__FAILURE_DEFAULT",
        "HEARTCORE_CLASSIFIER_FAILURE_DEFAULT");
    if (!failure_default.empty()) {
        config.classifier.failure_default = ParseDecisionDefault(
            failure_default,
            config.classifier.failure_default);
    }

    const auto wakeup_words = GetEnv("HEARTCORE_ATTENTION__WAKEUP_WORDS");
    if (!wakeup_words.empty()) {
        config.attention.wakeup_words = SplitCsv(wakeup_words);
    }

    const auto nicknames = GetEnv("HEARTCORE_FILTER__BOT_NICKNAMES");
    if (!nicknames.empty()) {
        config.filter.bot_nicknames = SplitCsv(nicknames);
    }

    const auto store_type = GetEnv("HEARTCORE_STORE__TYPE");
    if (!store_type.empty()) {
        config.store.type = store_type;
    }

    const auto store_path = GetEnvFallback("HEARTCORE_STORE__PATH", "HEARTCORE_DB_PATH");
    if (!store_path.empty()) {
        config.store.path = store_path;
    }

    const auto gateway_port = GetEnv("HEARTCORE_GATEWAY__PORT");
    if (!gateway_port.empty()) {
        config.gateway.port = ParseInt(gateway_port, config.gateway.port);
    }

    const auto workers = GetEnv("HEARTCORE_SCHEDULER__WORKER_THREADS");
    if (!workers.empty()) {
        config.scheduler.worker_threads = ParseInt(workers, config.scheduler.worker_threads);
    }

    const auto proactive = GetEnv("HEARTCORE_PROACTIVE__ENABLED");
    if (!proactive.empty()) {
        config.proactive.enabled = ParseBool(proactive);
    }

    const auto log_level = GetEnvFallback("HEARTCORE_LOGGING__LEVEL", "HEARTCORE_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

void Validate(Config& config) {
    const Config defaults{};
    auto& energy = config.energy;
    energy.initial = std::clamp(energy.initial, 0.0, 1.0);
    energy.floor = std::clamp(energy.floor, 0.0, 1.0);
    energy.cost_per_cycle = std::clamp(energy.cost_per_cycle, 0.0, 1.0);
    energy.daily_recovery = std::clamp(energy.daily_recovery, 0.0, 1.0);
    energy.recovery_increment = std::clamp(energy.recovery_increment, 0.0, 1.0);
    energy.recovery_ceiling = std::clamp(energy.recovery_ceiling, 0.0, 1.0);
    if (energy.recovery_silence_minutes <= 0) {
        energy.recovery_silence_minutes = defaults.energy.recovery_silence_minutes;
    }

    config.mood.decay_step = std::clamp(config.mood.decay_step, 0.0, 1.0);
    if (config.mood.decay_interval_s <= 0) {
        config.mood.decay_interval_s = defaults.mood.decay_interval_s;
    }

    if (config.debounce.quiet_period_s <= 0.0) {
        config.debounce.quiet_period_s = defaults.debounce.quiet_period_s;
    }
    if (config.debounce.max_window_s <= 0.0) {
        config.debounce.max_window_s = defaults.debounce.max_window_s;
    }
    if (config.debounce.max_window_s < config.debounce.quiet_period_s) {
        heartcore::utils::LogWarn("config", "debounce max window shorter than quiet period", {
            {"quiet", std::to_string(config.debounce.quiet_period_s)},
            {"max", std::to_string(config.debounce.max_window_s)}});
    }

    if (config.attention.background_pool_capacity <= 0) {
        config.attention.background_pool_capacity = defaults.attention.background_pool_capacity;
    }
    if (config.attention.ambient_context_capacity < 0) {
        config.attention.ambient_context_capacity = defaults.attention.ambient_context_capacity;
    }
    if (config.cache.eviction_ttl_s <= 0) {
        config.cache.eviction_ttl_s = defaults.cache.eviction_ttl_s;
    }
    if (config.cache.maintenance_interval_s <= 0) {
        config.cache.maintenance_interval_s = defaults.cache.maintenance_interval_s;
    }
    if (config.scheduler.worker_threads <= 0) {
        config.scheduler.worker_threads = defaults.scheduler.worker_threads;
    }
    if (config.scheduler.timer_threads <= 0) {
        config.scheduler.timer_threads = defaults.scheduler.timer_threads;
    }

    config.proactive.energy_threshold = std::clamp(config.proactive.energy_threshold, 0.0, 1.0);
    if (config.proactive.silence_threshold_minutes <= 0) {
        config.proactive.silence_threshold_minutes = defaults.proactive.silence_threshold_minutes;
    }
    if (config.proactive.global_cooldown_s < 0) {
        config.proactive.global_cooldown_s = defaults.proactive.global_cooldown_s;
    }
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            heartcore::utils::LogWarn("config", "failed to parse config, keeping defaults", {
                {"path", path.string()}, {"error", ex.what()}});
        }
    }

    ApplyEnvOverrides(config);
    Validate(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

}  // namespace heartcore::config
