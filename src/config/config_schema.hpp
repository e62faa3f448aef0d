#pragma once

#include <string>
#include <vector>

namespace heartcore::config {

enum class DecisionDefault {
    kReply,
    kWait,
    kIgnore
};

struct EnergyConfig {
    double initial = 0.8;
    double floor = 0.1;
    double cost_per_cycle = 0.05;
    double daily_recovery = 0.2;
    int recovery_silence_minutes = 60;
    double recovery_increment = 0.1;
    double recovery_ceiling = 0.8;
};

struct MoodConfig {
    int decay_interval_s = 1800;
    double decay_step = 0.1;
};

struct DebounceConfig {
    double quiet_period_s = 2.0;
    double max_window_s = 15.0;
};

struct AttentionConfig {
    int background_pool_capacity = 20;
    int ambient_context_capacity = 20;
    std::vector<std::string> wakeup_words;
};

struct CacheConfig {
    int eviction_ttl_s = 600;
    int maintenance_interval_s = 60;
};

struct ClassifierConfig {
    DecisionDefault failure_default = DecisionDefault::kIgnore;
    std::string model;
    int max_tokens = 256;
    double temperature = 0.1;
};

struct GeneratorConfig {
    std::string model;
    std::string persona = "You are a friendly member of this group chat.";
    int max_tokens = 1024;
    double temperature = 0.7;
};

struct ProviderConfig {
    std::string api_key;
    std::string api_base = "https://api.openai.com/v1";
    std::string model = "gpt-4o-mini";
    int timeout_s = 60;
    bool use_proxy = false;
};

struct FilterConfig {
    std::vector<std::string> bot_nicknames;
    std::vector<std::string> command_prefixes = {"/", "!", "\xEF\xBC\x81"};
    std::vector<std::string> command_words;
};

struct StoreConfig {
    std::string type = "sqlite";
    std::string path = "~/.heartcore/heartcore.db";
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct ProactiveConfig {
    bool enabled = false;
    double energy_threshold = 0.6;
    int silence_threshold_minutes = 180;
    int global_cooldown_s = 1800;
};

struct SchedulerConfig {
    // Classifier routing and generation.
    int worker_threads = 8;
    // Debounce window timers only.
    int timer_threads = 2;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    EnergyConfig energy;
    MoodConfig mood;
    DebounceConfig debounce;
    AttentionConfig attention;
    CacheConfig cache;
    ProactiveConfig proactive;
    ClassifierConfig classifier;
    GeneratorConfig generator;
    ProviderConfig provider;
    FilterConfig filter;
    StoreConfig store;
    GatewayConfig gateway;
    SchedulerConfig scheduler;
    LoggingConfig logging;
};

}  // namespace heartcore::config
