/*
  completion_cache.h

  This file is part of tabsh, a shell completion engine

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "tabsh_filesystem.h"

namespace completion_cache {

using Clock = std::chrono::steady_clock;
using ClockFunction = std::function<Clock::time_point()>;

constexpr std::chrono::milliseconds kPathListingTtl{2000};
constexpr std::chrono::milliseconds kCommandOutputTtl{3000};
constexpr std::chrono::milliseconds kAccountListTtl{5000};
constexpr std::chrono::milliseconds kInterfaceTtl{2000};
constexpr std::chrono::milliseconds kProcessListTtl{1000};

struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
};

// Fixed-TTL cache keyed by the resolved query. Entries are replaced wholesale; a fresh
// hit through get_or_load pushes its expiry out by another TTL. Concurrent misses on one
// key both load and the last writer wins.
template <typename V>
class TtlCache {
   public:
    explicit TtlCache(std::chrono::milliseconds ttl, ClockFunction clock = nullptr)
        : ttl_(ttl), clock_(clock ? std::move(clock) : ClockFunction([] { return Clock::now(); })) {
    }

    std::optional<V> get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.expires_at <= clock_()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void set(const std::string& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_();
        purge_expired_locked(now);
        entries_.insert_or_assign(key, Entry{std::move(value), now, now + ttl_});
    }

    bool extend_ttl(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        const auto now = clock_();
        if (it == entries_.end() || it->second.expires_at <= now) {
            return false;
        }
        it->second.expires_at = now + ttl_;
        return true;
    }

    // `loader` returns tabsh_filesystem::Result<V>; failures pass through uncached.
    template <typename Loader>
    tabsh_filesystem::Result<V> get_or_load(const std::string& key, Loader&& loader) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            const auto now = clock_();
            if (it != entries_.end() && it->second.expires_at > now) {
                it->second.expires_at = now + ttl_;
                ++stats_.hits;
                return tabsh_filesystem::Result<V>::ok(it->second.value);
            }
            ++stats_.misses;
        }

        tabsh_filesystem::Result<V> loaded = loader();
        if (loaded.is_ok()) {
            set(key, loaded.value());
        }
        return loaded;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    std::chrono::milliseconds ttl() const {
        return ttl_;
    }

   private:
    struct Entry {
        V value;
        Clock::time_point inserted_at;
        Clock::time_point expires_at;
    };

    void purge_expired_locked(Clock::time_point now) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.expires_at <= now) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::chrono::milliseconds ttl_;
    ClockFunction clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    CacheStats stats_;
};

}  // namespace completion_cache
