#include "session/memory_state_store.hpp"

#include "session/sqlite_state_store.hpp"
#include "config/config_loader.hpp"
#include "utils/logging.hpp"

namespace heartcore::session {

std::optional<PersistedState> MemoryStateStore::Load(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(session_id);
    if (it == rows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryStateStore::Save(const std::string& session_id, const PersistedState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    rows_.insert_or_assign(session_id, state);
    return true;
}

std::size_t MemoryStateStore::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

std::unique_ptr<StateStore> CreateStateStore(const heartcore::config::StoreConfig& config) {
    if (config.type == "memory") {
        return std::make_unique<MemoryStateStore>();
    }
    if (config.type != "sqlite") {
        heartcore::utils::LogWarn("store", "unknown store type, using sqlite", {{"type", config.type}});
    }
    return std::make_unique<SqliteStateStore>(heartcore::config::ExpandHome(config.path));
}

}  // namespace heartcore::session
