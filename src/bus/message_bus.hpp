#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <vector>

#include "bus/events.hpp"

namespace heartcore::bus {

class MessageBus {
public:
    using OutboundCallback = std::function<void(const OutboundMessage&)>;

    void PublishInbound(const InboundMessage& msg);
    bool TryConsumeInbound(InboundMessage& msg, std::chrono::milliseconds timeout);
    std::size_t InboundSize() const;
    void PublishOutbound(const OutboundMessage& msg);
    bool TryConsumeOutbound(OutboundMessage& msg, std::chrono::milliseconds timeout);
    std::size_t OutboundSize() const;
    void SubscribeOutbound(OutboundCallback callback);
    void DispatchOutbound();
    void Stop();

private:
    std::queue<InboundMessage> inbound_;
    std::queue<OutboundMessage> outbound_;
    mutable std::mutex mutex_;
    std::condition_variable inbound_cv_;
    std::condition_variable outbound_cv_;
    std::vector<OutboundCallback> subscribers_;
    std::atomic<bool> running_{true};
};

}  // namespace heartcore::bus
