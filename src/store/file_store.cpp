#include "file_store.hpp"
#include "../util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace memora {

static constexpr const char* kExtension = ".json";

// Keys become relative paths; reject anything that could escape the root.
static bool valid_key(const std::string& key) {
    if (key.empty() || key.front() == '/') return false;
    for (const auto& part : split(key, '/')) {
        if (part.empty() || part == "." || part == "..") return false;
    }
    return true;
}

FileStore::FileStore(const std::string& root) : root_(root) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw std::runtime_error("FileStore: cannot create " + root_ + ": " + ec.message());
    }
}

std::string FileStore::path_for(const std::string& key) const {
    return (std::filesystem::path(root_) / (key + kExtension)).string();
}

std::optional<std::string> FileStore::get(const std::string& key) {
    if (!valid_key(key)) return std::nullopt;
    std::lock_guard<std::mutex> lock(mutex_);

    std::string path = path_for(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return std::nullopt;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("FileStore: cannot read " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool FileStore::set(const std::string& key, const std::string& blob) {
    if (!valid_key(key)) {
        std::cerr << "[store] Rejected key: " << key << "\n";
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string path = path_for(key);
    if (!atomic_write_file(path, blob)) {
        std::cerr << "[store] Failed to write " << path << "\n";
        return false;
    }
    return true;
}

bool FileStore::remove(const std::string& key) {
    if (!valid_key(key)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(path_for(key), ec);
    if (ec) {
        std::cerr << "[store] Failed to remove " << key << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

std::vector<std::string> FileStore::list_keys(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> keys;
    std::error_code ec;
    const std::filesystem::path root(root_);
    auto it = std::filesystem::recursive_directory_iterator(root, ec);
    if (ec) return keys;

    const std::string ext = kExtension;
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        std::string rel = entry.path().lexically_relative(root).generic_string();
        if (rel.size() <= ext.size() ||
            rel.compare(rel.size() - ext.size(), ext.size(), ext) != 0) {
            continue;  // skips *.json.tmp leftovers too
        }
        std::string key = rel.substr(0, rel.size() - ext.size());
        if (key.rfind(prefix, 0) == 0) keys.push_back(std::move(key));
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace memora
