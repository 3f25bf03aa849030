#include "store.hpp"
#include "config.hpp"
#include "store/file_store.hpp"
#include "store/sqlite_store.hpp"
#include <iostream>

namespace memora {

std::unique_ptr<KeyValueStore> create_store(const Config& config) {
    const auto& backend = config.store.backend;
    if (backend == "sqlite") {
        return std::make_unique<SqliteStore>(config.store_path());
    }
    if (backend != "file") {
        std::cerr << "[store] Unknown store backend '" << backend
                  << "', falling back to file\n";
    }
    return std::make_unique<FileStore>(config.store_path());
}

} // namespace memora
