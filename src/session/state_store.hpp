#pragma once

#include <memory>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "session/session_types.hpp"

namespace heartcore::session {

// Durable key-value store for session state. Load returns nullopt for an
// unknown id and throws when the row cannot be read; Save returns false on
// failure and leaves retrying to the caller.
class StateStore {
public:
    virtual ~StateStore() = default;
    virtual std::optional<PersistedState> Load(const std::string& session_id) = 0;
    virtual bool Save(const std::string& session_id, const PersistedState& state) = 0;
    virtual std::size_t Count() const = 0;
};

std::unique_ptr<StateStore> CreateStateStore(const heartcore::config::StoreConfig& config);

}  // namespace heartcore::session
