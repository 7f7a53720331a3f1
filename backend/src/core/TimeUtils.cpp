#include "TimeUtils.hpp"
#include <cmath>
#include <cstdio>

namespace
{
    // Days since epoch -> civil date (proleptic Gregorian).
    void civilFromDays(std::int64_t z, int& y, unsigned& m, unsigned& d) {
        z += 719468;
        const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = doy - (153 * mp + 2) / 5 + 1;
        m = mp < 10 ? mp + 3 : mp - 9;
        y = static_cast<int>(yoe + era * 400) + (m <= 2 ? 1 : 0);
    }

    std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
        y -= m <= 2 ? 1 : 0;
        const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
    }

    std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
        std::int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
        return q;
    }
}

namespace TimeUtils
{
    std::time_t addHours(std::time_t t, double hours) {
        return t + static_cast<std::time_t>(std::llround(hours * static_cast<double>(SECONDS_PER_HOUR)));
    }

    long long wholeHoursBetween(std::time_t from, std::time_t to) {
        // integer division truncates toward zero
        return static_cast<long long>(to - from) / static_cast<long long>(SECONDS_PER_HOUR);
    }

    std::int64_t dayIndex(std::time_t t, int utcOffsetMinutes) {
        std::int64_t shifted = static_cast<std::int64_t>(t) + static_cast<std::int64_t>(utcOffsetMinutes) * 60;
        return floorDiv(shifted, SECONDS_PER_DAY);
    }

    std::string weekdayLabel(std::int64_t dayIdx) {
        static const char* names[] = { "Thu", "Fri", "Sat", "Sun", "Mon", "Tue", "Wed" }; // 1970-01-01 was a Thursday
        std::int64_t w = dayIdx % 7;
        if (w < 0) w += 7;
        return names[w];
    }

    std::string toIso(std::time_t t) {
        std::int64_t days = floorDiv(static_cast<std::int64_t>(t), SECONDS_PER_DAY);
        std::int64_t secs = static_cast<std::int64_t>(t) - days * SECONDS_PER_DAY;

        int y; unsigned m, d;
        civilFromDays(days, y, m, d);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
            y, m, d,
            static_cast<int>(secs / 3600),
            static_cast<int>((secs % 3600) / 60),
            static_cast<int>(secs % 60));
        return buf;
    }

    std::optional<std::time_t> fromIso(const std::string& text) {
        int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
        char z = 0;
        if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%c", &y, &mo, &d, &h, &mi, &s, &z) != 7 || z != 'Z')
            return std::nullopt;
        if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || s > 60)
            return std::nullopt;

        std::int64_t days = daysFromCivil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
        return static_cast<std::time_t>(days * SECONDS_PER_DAY + h * 3600 + mi * 60 + s);
    }

    double roundTo(double value, int decimals) {
        const double scale = std::pow(10.0, decimals);
        return std::round(value * scale) / scale;
    }
}
