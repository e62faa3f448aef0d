#include "sensors/message_filter.hpp"

#include <algorithm>
#include <sstream>

#include "agent/response_parsing.hpp"
#include "utils/logging.hpp"

namespace heartcore::sensors {
namespace {

constexpr const char* kZeroWidthSpace = "\xE2\x80\x8B";

std::string StripZeroWidth(std::string text) {
    const std::string needle(kZeroWidthSpace);
    std::string::size_type pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        text.erase(pos, needle.size());
    }
    return text;
}

}  // namespace

MessageFilter::MessageFilter(heartcore::config::FilterConfig config)
    : config_(std::move(config)) {
    for (const auto& word : config_.command_words) {
        const auto lowered = heartcore::agent::ToLower(heartcore::agent::Trim(word));
        if (!lowered.empty()) {
            command_words_.insert(lowered);
        }
    }
}

bool MessageFilter::IsCommand(const std::string& clean_text) const {
    for (const auto& prefix : config_.command_prefixes) {
        if (!prefix.empty() && clean_text.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    if (command_words_.empty()) {
        return false;
    }
    std::istringstream stream(heartcore::agent::ToLower(clean_text));
    std::string first_word;
    stream >> first_word;
    return command_words_.count(first_word) > 0;
}

bool MessageFilter::MentionsNickname(const std::string& text) const {
    return std::any_of(config_.bot_nicknames.begin(), config_.bot_nicknames.end(), [&](const std::string& nickname) {
        return !nickname.empty() && text.find(nickname) != std::string::npos;
    });
}

FilterResult MessageFilter::Filter(const heartcore::bus::RawEvent& event) const {
    FilterResult result{};
    if (!event.self_id.empty() && event.sender_id == event.self_id) {
        result.drop_reason = "self";
        return result;
    }

    result.clean_text = heartcore::agent::Trim(StripZeroWidth(event.text));
    if (!result.clean_text.empty() && IsCommand(result.clean_text)) {
        result.is_command = true;
        result.drop_reason = "command";
        heartcore::utils::LogDebug("gateway", "command filtered", {{"session", event.session_id}});
        return result;
    }

    if (result.clean_text.empty() && event.attachments.empty()) {
        result.drop_reason = "empty";
        return result;
    }

    const bool mentioned = !event.self_id.empty() &&
        std::find(event.mentions.begin(), event.mentions.end(), event.self_id) != event.mentions.end();
    result.wake_signal = mentioned || MentionsNickname(result.clean_text);
    result.accepted = true;
    return result;
}

std::optional<heartcore::bus::InboundMessage> MessageFilter::Accept(const heartcore::bus::RawEvent& event) const {
    const auto result = Filter(event);
    if (!result.accepted) {
        return std::nullopt;
    }
    return ToInbound(event, result);
}

heartcore::bus::InboundMessage MessageFilter::ToInbound(
    const heartcore::bus::RawEvent& event,
    const FilterResult& result) {
    heartcore::bus::InboundMessage msg{};
    msg.session_id = event.session_id;
    msg.sender_id = event.sender_id;
    msg.sender_name = event.sender_name;
    msg.text = result.clean_text;
    msg.attachment_refs = event.attachments;
    msg.wake_signal = result.wake_signal;
    msg.metadata = event.metadata;
    msg.arrival_time = event.timestamp;
    return msg;
}

}  // namespace heartcore::sensors
