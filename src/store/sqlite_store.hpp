#pragma once
#include "../store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace memora {

// Key-value records in a single SQLite table.
class SqliteStore : public KeyValueStore {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& blob) override;
    bool remove(const std::string& key) override;
    std::vector<std::string> list_keys(const std::string& prefix) override;

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace memora
