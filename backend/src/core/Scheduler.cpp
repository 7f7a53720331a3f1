#include "Scheduler.hpp"
#include "TimeUtils.hpp"
#include <algorithm>
#include <cmath>

Scheduler::Scheduler(double minIntervalHours)
    : min_interval_hours(std::max(DEFAULT_MIN_INTERVAL_HOURS, minIntervalHours))
{
    spdlog::debug("Scheduler (SM-2) initialized, min interval {}h", min_interval_hours);
}

ReviewResult Scheduler::nextSchedule(int quality, std::time_t reviewedAt,
    const std::optional<ScheduleState>& previous) const {
    return nextSchedule(quality, reviewedAt, previous, min_interval_hours);
}

ReviewResult Scheduler::nextSchedule(int quality, std::time_t reviewedAt,
    const std::optional<ScheduleState>& previous, double minIntervalHours) {
    if (quality < MIN_QUALITY || quality > MAX_QUALITY) {
        throw InvalidInput("quality must be between 0 and 5 inclusive, got " + std::to_string(quality));
    }

    // A caller cannot request a minimum shorter than the built-in default
    const double minInterval = std::isfinite(minIntervalHours)
        ? std::max(DEFAULT_MIN_INTERVAL_HOURS, minIntervalHours)
        : DEFAULT_MIN_INTERVAL_HOURS;

    const double previousEase = previous ? previous->ease_factor : INITIAL_EASE_FACTOR;
    const int previousStreak = previous ? previous->streak : 0;

    const double nextEase = std::max(MIN_EASE_FACTOR, previousEase + easeDelta(quality));

    ReviewResult result;
    result.was_successful = quality >= SUCCESS_QUALITY;

    ScheduleState& next = result.schedule;
    next.algorithm = (previous && !previous->algorithm.empty()) ? previous->algorithm : algorithmId();
    next.ease_factor = TimeUtils::roundTo(nextEase, 4);

    if (result.was_successful) {
        next.streak = previousStreak + 1;
        next.interval_hours = computeNextInterval(previous, nextEase, minInterval);
    }
    else {
        next.streak = 0;
        next.interval_hours = minInterval;
    }

    next.last_reviewed_at = reviewedAt;
    next.due_at = TimeUtils::addHours(reviewedAt, next.interval_hours);

    spdlog::debug("SM-2 review: q={} streak {}->{} ease {:.4f}->{:.4f} interval={}h due={}",
        quality, previousStreak, next.streak, previousEase, next.ease_factor,
        next.interval_hours, TimeUtils::toIso(next.due_at));

    if (!result.was_successful && previousStreak > 0) {
        spdlog::warn("SM-2 relapse after streak of {}", previousStreak);
    }

    return result;
}

// 0 at quality 4, positive at 5, negative below
double Scheduler::easeDelta(int quality) {
    const double offset = static_cast<double>(MAX_QUALITY - quality);
    return 0.1 - offset * (0.08 + offset * 0.02);
}

double Scheduler::computeNextInterval(const std::optional<ScheduleState>& previous,
    double nextEase, double minInterval) {
    const int previousStreak = previous ? previous->streak : 0;

    if (previousStreak <= 0) {
        return minInterval;
    }
    if (previousStreak == 1) {
        // graduation step, independent of ease
        return 6.0 * minInterval;
    }

    const double previousInterval = previous->interval_hours;
    if (!(previousInterval > 0.0)) {
        return minInterval;
    }
    return std::max(minInterval, std::round(previousInterval * nextEase));
}
