#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <chrono>
#include <functional>
#include <system_error>

#include <gtest/gtest.h>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#endif

namespace kgstore {
namespace testutil {

inline std::string SanitizeForPath(std::string s) {
    for (auto& ch : s) {
        if (ch == '/' || ch == '\\' || ch == ' ' || ch == ':' || ch == '\t' || ch == '\n' || ch == '\r') {
            ch = '_';
        }
    }
    return s;
}

// Creates a unique per-test directory path under the system temp directory.
// Each SQLite file must be private to one test; ":memory:" would give every
// pooled connection its own empty database.
inline std::filesystem::path MakeUniqueTestDir(const std::string& prefix) {
    std::string name = prefix;

    if (const auto* info = ::testing::UnitTest::GetInstance()->current_test_info()) {
        name += "_" + std::string(info->test_suite_name()) + "_" + std::string(info->name());
    }

#if defined(__unix__) || defined(__APPLE__)
    name += "_pid" + std::to_string(static_cast<long long>(::getpid()));
#endif

    name += "_t" + std::to_string(
        static_cast<long long>(std::chrono::steady_clock::now().time_since_epoch().count()));

    return std::filesystem::temp_directory_path() / SanitizeForPath(name);
}

// Removes the directory when the test ends
class ScopedTestDir {
public:
    explicit ScopedTestDir(const std::string& prefix) : path_(MakeUniqueTestDir(prefix)) {
        std::filesystem::create_directories(path_);
    }
    ~ScopedTestDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTestDir(const ScopedTestDir&) = delete;
    ScopedTestDir& operator=(const ScopedTestDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

// Settable clock for versioning and partition tests
class ManualClock {
public:
    explicit ManualClock(int64_t start) : now_(start) {}

    int64_t now() const { return now_.load(); }
    void set(int64_t t) { now_.store(t); }
    void advance(int64_t delta) { now_.fetch_add(delta); }

    std::function<int64_t()> as_clock() {
        return [this]() { return now_.load(); };
    }

private:
    std::atomic<int64_t> now_;
};

} // namespace testutil
} // namespace kgstore
