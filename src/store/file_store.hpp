#pragma once
#include "../store.hpp"
#include <mutex>
#include <string>

namespace memora {

// One file per key under a root directory. "session/abc" is stored as
// <root>/session/abc.json. Writes are atomic (tmp + rename).
class FileStore : public KeyValueStore {
public:
    explicit FileStore(const std::string& root);

    std::string backend_name() const override { return "file"; }

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& blob) override;
    bool remove(const std::string& key) override;
    std::vector<std::string> list_keys(const std::string& prefix) override;

    const std::string& root() const { return root_; }

private:
    std::string path_for(const std::string& key) const;

    std::string root_;
    mutable std::mutex mutex_;
};

} // namespace memora
