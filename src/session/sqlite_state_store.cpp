#include "session/sqlite_state_store.hpp"

#include <stdexcept>
#include <system_error>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace heartcore::session {

SqliteStateStore::SqliteStateStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
    EnsureSchema();
}

SqliteStateStore::~SqliteStateStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::optional<PersistedState> SqliteStateStore::Load(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql =
        "SELECT energy, mood, last_reset_date, total_replies, last_reply_time "
        "FROM chat_states WHERE session_id = ?;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    const auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        throw std::runtime_error(std::string("sqlite read failed: ") + sqlite3_errmsg(db_));
    }
    PersistedState state{};
    state.session_id = session_id;
    state.energy = sqlite3_column_double(stmt, 0);
    state.mood = sqlite3_column_double(stmt, 1);
    state.last_reset_date = SafeText(sqlite3_column_text(stmt, 2));
    state.total_replies = sqlite3_column_int(stmt, 3);
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
        state.last_reply_time = heartcore::utils::FromEpochSeconds(sqlite3_column_double(stmt, 4));
    }
    sqlite3_finalize(stmt);
    return state;
}

bool SqliteStateStore::Save(const std::string& session_id, const PersistedState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string upsert_sql =
        "INSERT INTO chat_states(session_id, energy, mood, last_reset_date, total_replies, "
        "last_reply_time, updated_at) VALUES(?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(session_id) DO UPDATE SET energy=excluded.energy, mood=excluded.mood, "
        "last_reset_date=excluded.last_reset_date, total_replies=excluded.total_replies, "
        "last_reply_time=excluded.last_reply_time, updated_at=excluded.updated_at;";
    if (sqlite3_prepare_v2(db_, upsert_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        heartcore::utils::LogWarn("sqlite", "prepare failed", {{"error", sqlite3_errmsg(db_)}});
        return false;
    }
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 2, state.energy);
    sqlite3_bind_double(stmt, 3, state.mood);
    sqlite3_bind_text(stmt, 4, state.last_reset_date.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, state.total_replies);
    if (state.last_reply_time.has_value()) {
        sqlite3_bind_double(stmt, 6, heartcore::utils::ToEpochSeconds(*state.last_reply_time));
    } else {
        sqlite3_bind_null(stmt, 6);
    }
    sqlite3_bind_double(stmt, 7, heartcore::utils::ToEpochSeconds(heartcore::utils::Now()));
    const auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        heartcore::utils::LogWarn("sqlite", "save failed", {
            {"session", session_id}, {"error", sqlite3_errmsg(db_)}});
        return false;
    }
    return true;
}

std::size_t SqliteStateStore::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM chat_states;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    std::size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

void SqliteStateStore::EnsureSchema() {
    if (db_) {
        return;
    }
    if (db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        heartcore::utils::LogError("sqlite", "failed to open db", {{"path", db_path_.string()}});
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    Exec(db_, "PRAGMA journal_mode=WAL;");
    Exec(db_, "CREATE TABLE IF NOT EXISTS chat_states ("
             "session_id TEXT PRIMARY KEY,"
             "energy REAL,"
             "mood REAL,"
             "last_reset_date TEXT,"
             "total_replies INTEGER,"
             "last_reply_time REAL,"
             "updated_at REAL"
             ");");
}

bool SqliteStateStore::Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) {
            heartcore::utils::LogWarn("sqlite", "exec error", {{"error", err}});
            sqlite3_free(err);
        }
        return false;
    }
    return true;
}

std::string SqliteStateStore::SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace heartcore::session
