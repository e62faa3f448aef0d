#pragma once

#include <optional>
#include <string>
#include <unordered_set>

#include "bus/events.hpp"
#include "config/config_schema.hpp"

namespace heartcore::sensors {

struct FilterResult {
    bool accepted = false;
    std::string clean_text;
    bool is_command = false;
    bool wake_signal = false;
    std::string drop_reason;
};

// Cleans raw platform events before admission: drops self-sent, empty and
// command messages, and detects the wake signal.
class MessageFilter {
public:
    explicit MessageFilter(heartcore::config::FilterConfig config);

    FilterResult Filter(const heartcore::bus::RawEvent& event) const;

    // Filter plus conversion; nullopt when the event is dropped.
    std::optional<heartcore::bus::InboundMessage> Accept(const heartcore::bus::RawEvent& event) const;

    static heartcore::bus::InboundMessage ToInbound(
        const heartcore::bus::RawEvent& event,
        const FilterResult& result);

private:
    bool IsCommand(const std::string& clean_text) const;
    bool MentionsNickname(const std::string& text) const;

    heartcore::config::FilterConfig config_;
    std::unordered_set<std::string> command_words_;
};

}  // namespace heartcore::sensors
