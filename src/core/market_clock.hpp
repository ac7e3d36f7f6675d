#pragma once

#include <chrono>
#include <ctime>

namespace exchange_sim {

/**
 * Trading-session flags for a wall-clock instant.
 *
 * US hours:       9:30 AM - 4:00 PM ET, weekdays
 * London overlap: 8:00 AM - 11:30 AM ET, weekdays
 */
struct SessionFlags {
    bool us_hours{false};
    bool london_overlap{false};
    bool weekend{false};
};

class MarketClock {
public:
    static constexpr int kUsOpenMinutes = 570;
    static constexpr int kUsCloseMinutes = 960;
    static constexpr int kLondonOverlapStartMinutes = 480;
    static constexpr int kLondonOverlapEndMinutes = 690;

    static SessionFlags session_flags(std::chrono::system_clock::time_point ts) {
        std::tm tm_et = to_et_tm(ts);
        SessionFlags flags;
        int wday = tm_et.tm_wday;
        flags.weekend = (wday == 0 || wday == 6);
        if (flags.weekend) return flags;

        int minutes_from_midnight = tm_et.tm_hour * 60 + tm_et.tm_min;
        flags.us_hours = minutes_from_midnight >= kUsOpenMinutes &&
                         minutes_from_midnight < kUsCloseMinutes;
        flags.london_overlap = minutes_from_midnight >= kLondonOverlapStartMinutes &&
                               minutes_from_midnight < kLondonOverlapEndMinutes;
        return flags;
    }

private:
    static int day_of_week(int year, int month, int day) {
        static const int table[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
        if (month < 3) {
            year -= 1;
        }
        return (year + year / 4 - year / 100 + year / 400 + table[month - 1] + day) % 7;
    }

    static int nth_weekday_of_month(int year, int month, int weekday, int nth) {
        int first_wday = day_of_week(year, month, 1);
        int day = 1 + ((7 + weekday - first_wday) % 7);
        day += (nth - 1) * 7;
        return day;
    }

    static std::chrono::system_clock::time_point utc_time_point(int year, int month, int day,
                                                                int hour) {
        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        return std::chrono::system_clock::from_time_t(timegm(&tm));
    }

    // US DST: second Sunday of March 07:00 UTC to first Sunday of November 06:00 UTC.
    static bool is_us_dst_utc(std::chrono::system_clock::time_point ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        std::tm tm_utc{};
        gmtime_r(&tt, &tm_utc);
        int year = tm_utc.tm_year + 1900;
        auto dst_start = utc_time_point(year, 3, nth_weekday_of_month(year, 3, 0, 2), 7);
        auto dst_end = utc_time_point(year, 11, nth_weekday_of_month(year, 11, 0, 1), 6);
        return ts >= dst_start && ts < dst_end;
    }

    static std::tm to_et_tm(std::chrono::system_clock::time_point ts) {
        int offset_min = is_us_dst_utc(ts) ? -240 : -300;
        auto adjusted = ts + std::chrono::minutes(offset_min);
        auto tt = std::chrono::system_clock::to_time_t(adjusted);
        std::tm out{};
        gmtime_r(&tt, &out);
        return out;
    }
};

} // namespace exchange_sim
