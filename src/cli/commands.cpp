#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <unistd.h>

#include "admission/admission_policy.hpp"
#include "agent/llm_classifier.hpp"
#include "agent/llm_generator.hpp"
#include "bus/message_bus.hpp"
#include "config/config_loader.hpp"
#include "dispatch/debounce_aggregator.hpp"
#include "dispatch/dispatch_loop.hpp"
#include "dispatch/dual_pool_dispatcher.hpp"
#include "gateway/http_gateway.hpp"
#include "heartbeat/state_decay_scheduler.hpp"
#include "providers/llm_provider.hpp"
#include "scheduler/thread_pool_scheduler.hpp"
#include "sensors/message_filter.hpp"
#include "session/session_state_store.hpp"
#include "session/state_store.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

std::filesystem::path GetPidFilePath() {
    return std::filesystem::path(heartcore::config::ExpandHome("~/.heartcore/gateway.pid"));
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    std::ifstream input(GetPidFilePath());
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    std::error_code ec;
    std::filesystem::remove(GetPidFilePath(), ec);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

heartcore::config::Config LoadAndApplyConfig() {
    auto config = heartcore::config::LoadConfig();
    heartcore::utils::SetLogConfig(heartcore::utils::LogConfig{
        heartcore::utils::ParseLogLevel(config.logging.level)});
    return config;
}

int RunGateway() {
    const auto config = LoadAndApplyConfig();

    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "heartcore gateway already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();
    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write gateway pid file." << std::endl;
        return 1;
    }

    auto provider = heartcore::providers::CreateProvider(config.provider);
    auto durable = heartcore::session::CreateStateStore(config.store);
    if (!provider || !durable) {
        std::cout << "Failed to create provider or store." << std::endl;
        RemovePidFile();
        return 1;
    }

    heartcore::bus::MessageBus bus;
    heartcore::scheduler::ThreadPoolScheduler timers(static_cast<std::size_t>(config.scheduler.timer_threads));
    heartcore::scheduler::ThreadPoolScheduler workers(static_cast<std::size_t>(config.scheduler.worker_threads));
    heartcore::session::SessionStateStore store(
        *durable,
        {.initial_energy = config.energy.initial, .daily_recovery = config.energy.daily_recovery});

    heartcore::agent::LlmClassifier classifier(*provider, config.classifier);
    heartcore::agent::LlmGenerator generator(*provider, config.generator);
    heartcore::admission::AdmissionPolicy policy(classifier, heartcore::admission::MakeAdmissionOptions(config));
    heartcore::dispatch::DebounceAggregator aggregator(
        store,
        timers,
        workers,
        generator,
        heartcore::dispatch::MakeDebounceOptions(config),
        [&bus](const heartcore::bus::OutboundMessage& outbound) { bus.PublishOutbound(outbound); });
    heartcore::dispatch::DualPoolDispatcher dispatcher(
        store, policy, aggregator, heartcore::dispatch::MakeDispatcherOptions(config));
    heartcore::dispatch::DispatchLoop dispatch_loop(bus, dispatcher, workers);
    heartcore::heartbeat::StateDecayScheduler decay(
        store,
        heartcore::heartbeat::MakeDecayOptions(config),
        [&aggregator](std::shared_ptr<heartcore::session::SessionState> session) {
            return aggregator.OpenProactive(std::move(session));
        });

    heartcore::sensors::MessageFilter filter(config.filter);
    heartcore::gateway::HttpGateway http(config.gateway.host, config.gateway.port, filter, bus, store);

    bus.SubscribeOutbound([](const heartcore::bus::OutboundMessage& outbound) {
        std::cout << "[" << outbound.session_id << "] -> " << outbound.reply_to << ": "
                  << outbound.content << std::endl;
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    timers.Start();
    workers.Start();
    dispatch_loop.Start();
    decay.Start();
    http.Start();
    std::thread outbound_thread([&bus]() { bus.DispatchOutbound(); });

    std::cout << "heartcore gateway started on " << config.gateway.host << ":" << config.gateway.port
              << ". Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    heartcore::utils::LogInfo("gateway", "shutting down", {{"signal", std::to_string(g_signal)}});
    http.Stop();
    dispatch_loop.Stop();
    decay.Stop();
    timers.Stop();
    workers.Stop();
    bus.Stop();
    if (outbound_thread.joinable()) {
        outbound_thread.join();
    }

    const auto failed = store.FlushAll();
    if (failed > 0) {
        heartcore::utils::LogError("gateway", "sessions not persisted", {{"count", std::to_string(failed)}});
    }
    RemovePidFile();
    return failed > 0 ? 1 : 0;
}

int RunTick() {
    const auto config = LoadAndApplyConfig();
    auto durable = heartcore::session::CreateStateStore(config.store);
    if (!durable) {
        std::cout << "Failed to open store." << std::endl;
        return 1;
    }
    std::cout << "store=" << config.store.type
              << " sessions=" << durable->Count()
              << " classifierFailureDefault=" << heartcore::config::ToString(config.classifier.failure_default)
              << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "gateway") {
        return RunGateway();
    }
    if (argc >= 2 && std::string(argv[1]) == "tick") {
        return RunTick();
    }
    std::cout << "Usage: heartcore gateway | heartcore tick" << std::endl;
    return 1;
}
