#pragma once
#include <sqlite3.h>
#include <stdexcept>
#include <string>

namespace memora {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Open (creating parent directories) and apply the pragmas both sqlite
// backends use. Throws std::runtime_error on failure.
sqlite3* open_sqlite(const std::string& path, const char* owner);

// Run a statement that returns no rows. Returns false and logs on error.
bool exec_sql(sqlite3* db, const char* sql, const char* owner);

inline std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* v = sqlite3_column_text(stmt, col);
    return v ? reinterpret_cast<const char*>(v) : std::string();
}

} // namespace memora
