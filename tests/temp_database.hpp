#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <system_error>

namespace pairank {
namespace test_support {

/// Fresh database file per test, removed afterwards with its WAL files.
struct TempDatabase {
    std::string path;

    explicit TempDatabase(const std::string& name) {
        static std::atomic<int> counter{0};
        auto dir = std::filesystem::temp_directory_path();
        path = (dir / ("pairank_" + name + "_" + std::to_string(counter++) + ".db")).string();
        cleanup();
    }

    ~TempDatabase() { cleanup(); }

    void cleanup() const {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
            std::filesystem::remove(path + suffix, ec);
        }
    }
};

} // namespace test_support
} // namespace pairank
