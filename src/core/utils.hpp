#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace exchange_sim {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Shared helpers for time conversion, ids and price rounding.
 */
namespace utils {

constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;
constexpr int64_t kYearMs = 365LL * kDayMs;

/**
 * Convert timestamp to milliseconds since epoch.
 */
inline int64_t ts_to_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/**
 * Convert milliseconds since epoch to Timestamp.
 */
inline Timestamp ms_to_ts(int64_t ms) {
    return Timestamp{} + std::chrono::milliseconds(ms);
}

inline int64_t now_ms() {
    return ts_to_ms(std::chrono::system_clock::now());
}

/**
 * Format epoch milliseconds as ISO 8601 string (e.g., "2024-01-15T10:30:00Z").
 */
inline std::string ms_to_iso(int64_t ms) {
    if (ms <= 0) return "";
    auto t = std::chrono::system_clock::to_time_t(ms_to_ts(ms));
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

/**
 * Start of the bucket of width interval_ms containing ts_ms.
 */
inline int64_t floor_to_interval(int64_t ts_ms, int64_t interval_ms) {
    if (interval_ms <= 0) return ts_ms;
    int64_t q = ts_ms / interval_ms;
    if (ts_ms < 0 && ts_ms % interval_ms != 0) --q;
    return q * interval_ms;
}

/**
 * Generate a UUID-like ID.
 */
inline std::string generate_id() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (dist(gen) & 0xFFFFFFFF) << "-";
    ss << std::setw(4) << (dist(gen) & 0xFFFF) << "-";
    ss << std::setw(4) << ((dist(gen) & 0x0FFF) | 0x4000) << "-";
    ss << std::setw(4) << ((dist(gen) & 0x3FFF) | 0x8000) << "-";
    ss << std::setw(12) << (dist(gen) & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

inline double round_to(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

inline double floor_to(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::floor(value * factor + 1e-9) / factor;
}

inline double ceil_to(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::ceil(value * factor - 1e-9) / factor;
}

inline double clamp(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

} // namespace utils
} // namespace exchange_sim
