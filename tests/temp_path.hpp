#pragma once
#include <atomic>
#include <filesystem>
#include <string>
#include <unistd.h>

// Unique per-process path under /tmp, removed (recursively) on scope exit.
struct TempPath {
    std::string path;

    explicit TempPath(const std::string& name) {
        static std::atomic<int> counter{0};
        path = "/tmp/memora_test_" + name + "_" + std::to_string(getpid()) +
               "_" + std::to_string(counter++);
    }

    ~TempPath() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::remove(path + "-wal", ec);
        std::filesystem::remove(path + "-shm", ec);
    }

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;
};
