#pragma once
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include "ScheduleState.hpp"

// Raised only for a quality grade outside [0,5]. A caller bug, never transient.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

/*
  SM-2 interval engine.
   - quality 0..5, success is quality >= 3
   - ease grows on 5, holds on 4, shrinks on <= 3, floored at 1.3
   - first success -> min interval, second -> 6x min interval, then interval * ease
   - any failure resets the streak and relapses to the min interval
  Stateless: every call reads only its arguments.
*/
class Scheduler {
public:
    static constexpr double DEFAULT_MIN_INTERVAL_HOURS = 24.0;
    static constexpr double MIN_EASE_FACTOR = 1.3;
    static constexpr double INITIAL_EASE_FACTOR = 2.5;
    static constexpr int MIN_QUALITY = 0;
    static constexpr int MAX_QUALITY = 5;
    static constexpr int SUCCESS_QUALITY = 3;

    explicit Scheduler(double minIntervalHours = DEFAULT_MIN_INTERVAL_HOURS);

    // Uses the min interval this scheduler was constructed with.
    ReviewResult nextSchedule(int quality, std::time_t reviewedAt,
        const std::optional<ScheduleState>& previous) const;

    static ReviewResult nextSchedule(int quality, std::time_t reviewedAt,
        const std::optional<ScheduleState>& previous, double minIntervalHours);

    double minIntervalHours() const { return min_interval_hours; }

    static const char* algorithmId() { return "sm2"; }

private:
    double min_interval_hours;

    static double easeDelta(int quality);
    static double computeNextInterval(const std::optional<ScheduleState>& previous,
        double nextEase, double minInterval);
};
