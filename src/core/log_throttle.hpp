#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace exchange_sim {

/**
 * Per-key fixed window limiter for log lines. allow() returns true at most
 * once per window for a given key. suppressed() reports how many lines were
 * dropped in the window closed by the last allowed one.
 */
class LogThrottle {
public:
    explicit LogThrottle(std::chrono::milliseconds window = std::chrono::milliseconds(15000))
        : window_(window) {}

    bool allow(const std::string& key) {
        return allow(key, std::chrono::steady_clock::now());
    }

    bool allow(const std::string& key, std::chrono::steady_clock::time_point now) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = buckets_.find(key);
        if (it == buckets_.end()) {
            buckets_.emplace(key, Bucket{now, 0, 0});
            return true;
        }
        auto& entry = it->second;
        if (now - entry.last_emit >= window_) {
            entry.last_emit = now;
            entry.reported = entry.suppressed;
            entry.suppressed = 0;
            return true;
        }
        ++entry.suppressed;
        return false;
    }

    uint64_t suppressed(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = buckets_.find(key);
        return it == buckets_.end() ? 0 : it->second.reported;
    }

private:
    struct Bucket {
        std::chrono::steady_clock::time_point last_emit;
        uint64_t suppressed{0};
        uint64_t reported{0};
    };
    std::chrono::milliseconds window_;
    std::unordered_map<std::string, Bucket> buckets_;
    mutable std::mutex mu_;
};

} // namespace exchange_sim
