#pragma once

#include <gtest/gtest.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <system_error>
#include <vector>

#include "completion_cache.h"
#include "completion_candidate.h"
#include "completion_paths.h"
#include "tabsh.h"
#include "tabsh_filesystem.h"

namespace test_support {

namespace fs = std::filesystem;
using completion_candidate::Candidate;

// Fresh directory under the system temp dir, removed with its contents.
class ScratchDir {
   public:
    ScratchDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() / ("tabsh-test-" + std::to_string(::getpid()) + "-" +
                                             std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const {
        return path_;
    }

    fs::path write(const std::string& relative, const std::string& content) {
        fs::path target = path_ / relative;
        fs::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << content;
        return target;
    }

    fs::path make_dir(const std::string& relative) {
        fs::path target = path_ / relative;
        fs::create_directories(target);
        return target;
    }

    fs::path make_executable(const std::string& relative) {
        fs::path target = write(relative, "#!/bin/sh\nexit 0\n");
        fs::permissions(target, fs::perms::owner_all | fs::perms::group_read |
                                    fs::perms::group_exec | fs::perms::others_read |
                                    fs::perms::others_exec);
        return target;
    }

   private:
    fs::path path_;
};

// Overrides one environment variable for the lifetime of the guard.
class EnvGuard {
   public:
    EnvGuard(const char* name, const std::string& value) : name_(name) {
        const char* previous = std::getenv(name);
        had_previous_ = previous != nullptr;
        if (had_previous_) {
            previous_ = previous;
        }
        ::setenv(name, value.c_str(), 1);
    }

    ~EnvGuard() {
        if (had_previous_) {
            ::setenv(name_.c_str(), previous_.c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

   private:
    std::string name_;
    bool had_previous_ = false;
    std::string previous_;
};

class FakeClock {
   public:
    completion_cache::ClockFunction function() {
        return [this]() { return now_; };
    }

    void advance(std::chrono::milliseconds delta) {
        now_ += delta;
    }

   private:
    completion_cache::Clock::time_point now_ =
        completion_cache::Clock::time_point{} + std::chrono::hours(1);
};

// In-memory directory tree for the listing cache; unknown directories fail to list.
class FakeDirectories {
   public:
    void add(const std::string& directory, const std::string& name,
             tabsh_filesystem::EntryKind kind) {
        auto& entries = listings_[directory];
        entries.push_back(tabsh_filesystem::DirectoryEntry{name, kind});
        std::sort(entries.begin(), entries.end(),
                  [](const tabsh_filesystem::DirectoryEntry& a,
                     const tabsh_filesystem::DirectoryEntry& b) { return a.name < b.name; });
    }

    completion_paths::DirectoryReader reader() {
        return [this](const fs::path& directory) {
            ++reads_;
            auto it = listings_.find(directory.string());
            if (it == listings_.end()) {
                return tabsh_filesystem::Result<completion_paths::DirectoryListing>::error(
                    "no such directory: " + directory.string());
            }
            return tabsh_filesystem::Result<completion_paths::DirectoryListing>::ok(it->second);
        };
    }

    int reads() const {
        return reads_;
    }

   private:
    std::map<std::string, completion_paths::DirectoryListing> listings_;
    int reads_ = 0;
};

// Every config:: global is back at its default before and after each test.
class ConfigResetTest : public ::testing::Test {
   protected:
    void SetUp() override {
        config::reset_to_defaults();
    }
    void TearDown() override {
        config::reset_to_defaults();
    }
};

inline std::vector<std::string> texts(const std::vector<Candidate>& candidates) {
    std::vector<std::string> result;
    for (const auto& candidate : candidates) {
        result.push_back(candidate.text);
    }
    return result;
}

inline const Candidate* find_text(const std::vector<Candidate>& candidates,
                                  const std::string& text) {
    for (const auto& candidate : candidates) {
        if (candidate.text == text) {
            return &candidate;
        }
    }
    return nullptr;
}

inline bool has_text(const std::vector<Candidate>& candidates, const std::string& text) {
    return find_text(candidates, text) != nullptr;
}

}  // namespace test_support
