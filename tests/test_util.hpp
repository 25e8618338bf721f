#pragma once
// Shared helpers for the test suite: scratch directories and small file writers.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <unistd.h>

namespace testutil {

namespace fs = std::filesystem;

/// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> seq{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("linkstation-test-" + std::to_string(::getpid()) + "-" +
                 std::to_string(stamp) + "-" + std::to_string(seq++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }
    fs::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::trunc);
    out << content;
}

inline void touch(const fs::path& p) { write_file(p, ""); }

} // namespace testutil
