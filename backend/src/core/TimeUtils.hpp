#pragma once
#include <ctime>
#include <cstdint>
#include <optional>
#include <string>

// All instants are seconds since epoch (UTC). Durations in the data model are hours.
namespace TimeUtils
{
    constexpr std::time_t SECONDS_PER_HOUR = 60 * 60;
    constexpr std::time_t SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;

    std::time_t addHours(std::time_t t, double hours);

    // Whole hours from `from` to `to`, truncated toward zero.
    long long wholeHoursBetween(std::time_t from, std::time_t to);

    // Calendar day index (days since 1970-01-01) of `t` shifted by a UTC offset.
    std::int64_t dayIndex(std::time_t t, int utcOffsetMinutes = 0);

    // "Mon".."Sun" for a day index produced by dayIndex().
    std::string weekdayLabel(std::int64_t dayIdx);

    // 2025-01-01T00:00:00Z
    std::string toIso(std::time_t t);
    std::optional<std::time_t> fromIso(const std::string& text);

    double roundTo(double value, int decimals);
}
