#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "session/state_store.hpp"
#include "sqlite3.h"

namespace heartcore::session {

class SqliteStateStore : public StateStore {
public:
    explicit SqliteStateStore(std::filesystem::path db_path);
    ~SqliteStateStore() override;

    SqliteStateStore(const SqliteStateStore&) = delete;
    SqliteStateStore& operator=(const SqliteStateStore&) = delete;

    std::optional<PersistedState> Load(const std::string& session_id) override;
    bool Save(const std::string& session_id, const PersistedState& state) override;
    std::size_t Count() const override;

    bool IsOpen() const { return db_ != nullptr; }

private:
    void EnsureSchema();
    static bool Exec(sqlite3* db, const std::string& sql);
    static std::string SafeText(const unsigned char* text);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

}  // namespace heartcore::session
