#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace memora {

struct Config; // forward declaration

// Durable key-value persistence. Values are opaque blobs (JSON documents
// in practice). Implementations must be safe to call from several threads.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::string backend_name() const = 0;

    // nullopt when the key does not exist. Throws std::runtime_error on I/O failure.
    virtual std::optional<std::string> get(const std::string& key) = 0;

    // Insert or overwrite. Returns false on failure.
    virtual bool set(const std::string& key, const std::string& blob) = 0;

    // Returns false only on failure; removing a missing key succeeds.
    virtual bool remove(const std::string& key) = 0;

    // All keys starting with prefix, sorted.
    virtual std::vector<std::string> list_keys(const std::string& prefix) = 0;
};

// Key namespaces shared by the session and memory stores.
inline std::string session_key(const std::string& session_id) {
    return "session/" + session_id;
}

inline std::string memory_key(const std::string& memory_id) {
    return "memory/" + memory_id;
}

// Create the store configured in config.store ("sqlite" or "file").
// Unknown names fall back to the file store.
std::unique_ptr<KeyValueStore> create_store(const Config& config);

} // namespace memora
