#include "gateway/http_gateway.hpp"

#include "httplib.h"
#include "session/session_types.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace heartcore::gateway {

heartcore::bus::RawEvent RawEventFromJson(const nlohmann::json& json) {
    heartcore::bus::RawEvent event{};
    event.session_id = json.at("session_id").get<std::string>();
    event.sender_id = json.at("sender_id").get<std::string>();
    event.sender_name = json.value("sender_name", std::string());
    event.self_id = json.value("self_id", std::string());
    event.text = json.value("text", std::string());
    if (json.contains("mentions")) {
        event.mentions = json["mentions"].get<std::vector<std::string>>();
    }
    if (json.contains("attachments")) {
        event.attachments = json["attachments"].get<std::vector<std::string>>();
    }
    if (json.contains("metadata") && json["metadata"].is_object()) {
        for (const auto& item : json["metadata"].items()) {
            event.metadata[item.key()] = item.value().is_string() ? item.value().get<std::string>()
                                                                  : item.value().dump();
        }
    }
    if (json.contains("timestamp") && json["timestamp"].is_number()) {
        event.timestamp = heartcore::utils::FromEpochSeconds(json["timestamp"].get<double>());
    }
    return event;
}

nlohmann::json SnapshotToJson(const heartcore::session::SessionSnapshot& snapshot) {
    return {
        {"session_id", snapshot.session_id},
        {"energy", snapshot.energy},
        {"mood", snapshot.mood},
        {"total_replies", snapshot.total_replies},
        {"locked", snapshot.locked},
        {"owner_sender_id", snapshot.owner_sender_id.has_value() ? nlohmann::json(*snapshot.owner_sender_id)
                                                                 : nlohmann::json(nullptr)},
        {"phase", heartcore::session::ToString(snapshot.phase)},
        {"cycle_id", snapshot.cycle_id},
        {"accumulation_size", snapshot.accumulation_size},
        {"background_size", snapshot.background_size},
        {"ambient_size", snapshot.ambient_size},
        {"last_reply_time", snapshot.last_reply_time.has_value()
            ? nlohmann::json(heartcore::utils::ToEpochSeconds(*snapshot.last_reply_time))
            : nlohmann::json(nullptr)},
        {"last_daily_reset_date", snapshot.last_daily_reset_date},
        {"last_access_time", heartcore::utils::ToEpochSeconds(snapshot.last_access_time)},
        {"dirty", snapshot.dirty},
        {"load_pending", snapshot.load_pending}
    };
}

HttpGateway::HttpGateway(
    std::string host,
    int port,
    const heartcore::sensors::MessageFilter& filter,
    heartcore::bus::MessageBus& bus,
    heartcore::session::SessionStateStore& store)
    : host_(std::move(host))
    , port_(port)
    , filter_(filter)
    , bus_(bus)
    , store_(store)
    , server_(std::make_unique<httplib::Server>()) {
    RegisterRoutes();
}

HttpGateway::~HttpGateway() {
    Stop();
}

void HttpGateway::RegisterRoutes() {
    server_->Post("/events", [this](const httplib::Request& req, httplib::Response& res) {
        auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            res.status = 400;
            res.set_content(R"({"error":"invalid json"})", "application/json");
            return;
        }
        heartcore::bus::RawEvent event;
        try {
            event = RawEventFromJson(body);
        } catch (const nlohmann::json::exception& ex) {
            res.status = 400;
            res.set_content(nlohmann::json{{"error", ex.what()}}.dump(), "application/json");
            return;
        }
        const auto result = filter_.Filter(event);
        nlohmann::json reply{{"accepted", result.accepted}};
        if (result.accepted) {
            bus_.PublishInbound(heartcore::sensors::MessageFilter::ToInbound(event, result));
            reply["wake_signal"] = result.wake_signal;
        } else {
            reply["reason"] = result.drop_reason;
        }
        res.status = 202;
        res.set_content(reply.dump(), "application/json");
    });

    server_->Get("/sessions", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json json = nlohmann::json::array();
        for (const auto& snapshot : store_.Snapshots()) {
            json.push_back(SnapshotToJson(snapshot));
        }
        res.set_content(json.dump(2), "application/json");
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json json{
            {"status", "ok"},
            {"sessions", store_.Size()},
            {"inbound_queue", bus_.InboundSize()}
        };
        res.set_content(json.dump(), "application/json");
    });
}

void HttpGateway::Start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread([this]() {
        if (!server_->listen(host_, port_)) {
            heartcore::utils::LogError("gateway", "http server failed to listen", {
                {"host", host_}, {"port", std::to_string(port_)}});
        }
    });
    heartcore::utils::LogInfo("gateway", "http server starting", {
        {"host", host_}, {"port", std::to_string(port_)}});
}

void HttpGateway::Stop() {
    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

}  // namespace heartcore::gateway
