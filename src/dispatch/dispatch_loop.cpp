#include "dispatch/dispatch_loop.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "utils/logging.hpp"

namespace heartcore::dispatch {

DispatchLoop::DispatchLoop(
    heartcore::bus::MessageBus& bus,
    DualPoolDispatcher& dispatcher,
    heartcore::scheduler::TaskScheduler& workers)
    : bus_(bus)
    , dispatcher_(dispatcher)
    , workers_(workers) {}

DispatchLoop::~DispatchLoop() {
    Stop();
}

void DispatchLoop::Start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { Run(); });
}

void DispatchLoop::Stop() {
    running_ = false;
    if (worker_.joinable()) {
        worker_.join();
    }
}

void DispatchLoop::Run() {
    while (running_) {
        heartcore::bus::InboundMessage msg{};
        if (!bus_.TryConsumeInbound(msg, std::chrono::milliseconds(200))) {
            continue;
        }
        Enqueue(std::move(msg));
    }
}

void DispatchLoop::Enqueue(heartcore::bus::InboundMessage msg) {
    std::string session_id = msg.session_id;
    bool start_drain = false;
    {
        std::lock_guard<std::mutex> lock(strands_mutex_);
        auto [it, inserted] = strands_.try_emplace(session_id);
        it->second.push_back(std::move(msg));
        start_drain = inserted;
    }
    if (start_drain) {
        workers_.Post([this, session_id = std::move(session_id)]() { Drain(session_id); });
    }
}

void DispatchLoop::Drain(const std::string& session_id) {
    while (true) {
        heartcore::bus::InboundMessage msg{};
        {
            std::lock_guard<std::mutex> lock(strands_mutex_);
            auto it = strands_.find(session_id);
            if (it == strands_.end()) {
                return;
            }
            if (it->second.empty()) {
                strands_.erase(it);
                return;
            }
            msg = std::move(it->second.front());
            it->second.pop_front();
        }
        try {
            dispatcher_.OnMessage(msg);
        } catch (const std::exception& ex) {
            heartcore::utils::LogError("dispatcher", "message dropped after error", {
                {"session", msg.session_id}, {"error", ex.what()}});
        }
    }
}

}  // namespace heartcore::dispatch
