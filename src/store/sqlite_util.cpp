#include "sqlite_util.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>

namespace memora {

sqlite3* open_sqlite(const std::string& path, const char* owner) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : "unknown error";
        if (db) sqlite3_close(db);
        throw std::runtime_error(std::string(owner) + ": failed to open database: " + err);
    }

    // Concurrent readers while a writer is active; wait instead of failing on lock
    sqlite3_busy_timeout(db, 5000);
    exec_sql(db, "PRAGMA journal_mode=WAL;", owner);
    exec_sql(db, "PRAGMA synchronous=NORMAL;", owner);
    exec_sql(db, "PRAGMA temp_store=MEMORY;", owner);
    return db;
}

bool exec_sql(sqlite3* db, const char* sql, const char* owner) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[sqlite] " << owner << ": " << (err ? err : "error") << "\n";
        sqlite3_free(err);
        return false;
    }
    return true;
}

} // namespace memora
