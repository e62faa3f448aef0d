#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace heartcore::bus {

// Platform event before sanitizing. Mentions carry the ids addressed by
// the message (an @-mention of the bot is the usual wake signal).
struct RawEvent {
    std::string session_id;
    std::string sender_id;
    std::string sender_name;
    std::string self_id;
    std::string text;
    std::vector<std::string> mentions;
    std::vector<std::string> attachments;
    std::unordered_map<std::string, std::string> metadata;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

struct InboundMessage {
    std::string session_id;
    std::string sender_id;
    std::string sender_name;
    std::string text;
    std::vector<std::string> attachment_refs;
    bool wake_signal = false;
    std::unordered_map<std::string, std::string> metadata;
    std::chrono::system_clock::time_point arrival_time = std::chrono::system_clock::now();
};

struct OutboundMessage {
    std::string session_id;
    std::string content;
    std::string reply_to;
    std::unordered_map<std::string, std::string> metadata;
};

}  // namespace heartcore::bus
