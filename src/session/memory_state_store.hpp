#pragma once

#include <mutex>
#include <unordered_map>

#include "session/state_store.hpp"

namespace heartcore::session {

class MemoryStateStore : public StateStore {
public:
    std::optional<PersistedState> Load(const std::string& session_id) override;
    bool Save(const std::string& session_id, const PersistedState& state) override;
    std::size_t Count() const override;

private:
    std::unordered_map<std::string, PersistedState> rows_;
    mutable std::mutex mutex_;
};

}  // namespace heartcore::session
