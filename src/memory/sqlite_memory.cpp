#include "sqlite_memory.hpp"
#include "../memory_json.hpp"
#include "../store/sqlite_util.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace memora {

std::string build_fts_query(const std::string& query) {
    std::string result;
    std::string token;
    auto flush = [&]() {
        if (token.size() >= 2) {
            if (!result.empty()) result += " OR ";
            result += '"' + token + '"';
        }
        token.clear();
    };
    for (char c : query) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += c;
        } else {
            flush();
        }
    }
    flush();
    return result;
}

double bm25_relevance(double rank) {
    double s = rank < 0.0 ? -rank : 0.0;
    return s / (1.0 + s);
}

SqliteMemory::SqliteMemory(const std::string& path) : path_(path) {
    db_ = open_sqlite(path_, "SqliteMemory");
    // Allow FTS5 virtual table use inside triggers (required since SQLite 3.37)
    exec_sql(db_, "PRAGMA trusted_schema=ON;", "SqliteMemory");

    try {
        init_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteMemory::~SqliteMemory() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteMemory::init_schema() {
    static const char* const statements[] = {
        // One row per memory; document holds the full encoded record
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id         TEXT PRIMARY KEY,"
        "  user_id    TEXT NOT NULL,"
        "  content    TEXT NOT NULL,"
        "  document   TEXT NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ");",
        "CREATE INDEX IF NOT EXISTS memories_user ON memories(user_id);",

        "CREATE VIRTUAL TABLE IF NOT EXISTS memories_fts "
        "USING fts5(content, content=memories, content_rowid=rowid);",

        "CREATE TRIGGER IF NOT EXISTS memories_ai AFTER INSERT ON memories BEGIN"
        "  INSERT INTO memories_fts(rowid, content) VALUES (new.rowid, new.content);"
        "END;",
        "CREATE TRIGGER IF NOT EXISTS memories_ad AFTER DELETE ON memories BEGIN"
        "  INSERT INTO memories_fts(memories_fts, rowid, content)"
        "  VALUES ('delete', old.rowid, old.content);"
        "END;",
        "CREATE TRIGGER IF NOT EXISTS memories_au AFTER UPDATE ON memories BEGIN"
        "  INSERT INTO memories_fts(memories_fts, rowid, content)"
        "  VALUES ('delete', old.rowid, old.content);"
        "  INSERT INTO memories_fts(rowid, content) VALUES (new.rowid, new.content);"
        "END;",
    };
    for (const char* sql : statements) {
        if (!exec_sql(db_, sql, "SqliteMemory")) {
            throw std::runtime_error("SqliteMemory: failed to create schema in " + path_);
        }
    }
}

bool SqliteMemory::store(const Memory& memory) {
    std::string document;
    try {
        document = memory_to_json(memory).dump(
            -1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const std::exception& e) {
        std::cerr << "[memory] sqlite: cannot encode " << memory.id << ": " << e.what() << "\n";
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "INSERT INTO memories (id, user_id, content, document, updated_at)"
        " VALUES (?, ?, ?, ?, ?)"
        " ON CONFLICT(id) DO UPDATE SET user_id = excluded.user_id,"
        " content = excluded.content, document = excluded.document,"
        " updated_at = excluded.updated_at;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[memory] sqlite: prepare failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    sqlite3_bind_text(g.stmt, 1, memory.id.c_str(),      -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, memory.user_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, memory.content.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, document.c_str(),       -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 5, static_cast<sqlite3_int64>(epoch_millis()));

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[memory] sqlite: store " << memory.id << " failed: "
                  << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return true;
}

std::vector<ScoredMemory> SqliteMemory::search(const std::string& user_id,
                                               const std::string& query,
                                               uint32_t top_k) {
    std::string fts_query = build_fts_query(query);
    if (fts_query.empty() || top_k == 0) return {};

    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "SELECT m.document, bm25(memories_fts) AS rank"
        " FROM memories_fts JOIN memories m ON m.rowid = memories_fts.rowid"
        " WHERE memories_fts MATCH ? AND m.user_id = ?"
        " ORDER BY rank LIMIT ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[memory] sqlite: search prepare failed: " << sqlite3_errmsg(db_) << "\n";
        return {};
    }
    sqlite3_bind_text(g.stmt, 1, fts_query.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, user_id.c_str(),   -1, SQLITE_STATIC);
    sqlite3_bind_int(g.stmt, 3, static_cast<int>(top_k));

    std::vector<ScoredMemory> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        try {
            ScoredMemory hit;
            hit.memory = memory_from_json(nlohmann::json::parse(column_text(g.stmt, 0)));
            hit.relevance = bm25_relevance(sqlite3_column_double(g.stmt, 1));
            results.push_back(std::move(hit));
        } catch (const std::exception& e) {
            std::cerr << "[memory] sqlite: skipped unreadable row: " << e.what() << "\n";
        }
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        std::cerr << "[memory] sqlite: search failed: " << sqlite3_errmsg(db_) << "\n";
    }
    return results;
}

bool SqliteMemory::remove(const std::string& memory_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "DELETE FROM memories WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[memory] sqlite: prepare failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    sqlite3_bind_text(g.stmt, 1, memory_id.c_str(), -1, SQLITE_STATIC);
    return sqlite3_step(g.stmt) == SQLITE_DONE;
}

uint32_t SqliteMemory::count() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM memories;", -1, &g.stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

} // namespace memora
