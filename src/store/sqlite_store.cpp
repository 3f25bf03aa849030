#include "sqlite_store.hpp"
#include "sqlite_util.hpp"
#include "../util.hpp"
#include <iostream>
#include <stdexcept>

namespace memora {

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    db_ = open_sqlite(path_, "SqliteStore");

    const char* create_table =
        "CREATE TABLE IF NOT EXISTS records ("
        "  key        TEXT PRIMARY KEY,"
        "  value      TEXT NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ");";
    if (!exec_sql(db_, create_table, "SqliteStore")) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("SqliteStore: failed to create schema in " + path_);
    }
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::optional<std::string> SqliteStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "SELECT value FROM records WHERE key = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteStore: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return column_text(g.stmt, 0);
    if (rc == SQLITE_DONE) return std::nullopt;
    throw std::runtime_error(std::string("SqliteStore: ") + sqlite3_errmsg(db_));
}

bool SqliteStore::set(const std::string& key, const std::string& blob) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "INSERT INTO records (key, value, updated_at) VALUES (?, ?, ?)"
        " ON CONFLICT(key) DO UPDATE SET value = excluded.value,"
        " updated_at = excluded.updated_at;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[store] prepare failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, blob.c_str(), static_cast<int>(blob.size()), SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(epoch_millis()));

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[store] write failed for " << key << ": " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return true;
}

bool SqliteStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "DELETE FROM records WHERE key = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    return sqlite3_step(g.stmt) == SQLITE_DONE;
}

std::vector<std::string> SqliteStore::list_keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    // substr() comparison instead of LIKE: keys may contain % or _
    StmtGuard g;
    const char* sql =
        "SELECT key FROM records WHERE substr(key, 1, ?) = ? ORDER BY key;";
    std::vector<std::string> keys;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return keys;
    sqlite3_bind_int(g.stmt, 1, static_cast<int>(prefix.size()));
    sqlite3_bind_text(g.stmt, 2, prefix.c_str(), -1, SQLITE_STATIC);

    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        keys.push_back(column_text(g.stmt, 0));
    }
    return keys;
}

} // namespace memora
