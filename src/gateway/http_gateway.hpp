#pragma once

#include <memory>
#include <string>
#include <thread>

#include "bus/events.hpp"
#include "bus/message_bus.hpp"
#include "nlohmann/json.hpp"
#include "sensors/message_filter.hpp"
#include "session/session_state_store.hpp"

namespace httplib {
class Server;
}

namespace heartcore::gateway {

// Throws nlohmann::json::exception on a malformed body; missing optional
// fields keep their defaults.
heartcore::bus::RawEvent RawEventFromJson(const nlohmann::json& json);
nlohmann::json SnapshotToJson(const heartcore::session::SessionSnapshot& snapshot);

// POST /events, GET /sessions, GET /health.
class HttpGateway {
public:
    HttpGateway(
        std::string host,
        int port,
        const heartcore::sensors::MessageFilter& filter,
        heartcore::bus::MessageBus& bus,
        heartcore::session::SessionStateStore& store);
    ~HttpGateway();

    void Start();
    void Stop();

private:
    void RegisterRoutes();

    std::string host_;
    int port_;
    const heartcore::sensors::MessageFilter& filter_;
    heartcore::bus::MessageBus& bus_;
    heartcore::session::SessionStateStore& store_;
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
};

}  // namespace heartcore::gateway
