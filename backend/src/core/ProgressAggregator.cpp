#include "ProgressAggregator.hpp"
#include "TimeUtils.hpp"
#include <algorithm>
#include <unordered_set>
#include <utility>

ProgressAggregator::ProgressAggregator(int learnedStreakThreshold, int utcOffsetMinutes)
    : learned_streak_threshold(learnedStreakThreshold),
    utc_offset_minutes(utcOffsetMinutes)
{
}

ProgressStats ProgressAggregator::aggregate(const std::vector<VocabItem>& items,
    const std::vector<DrillSession>& sessions, std::time_t now) const {
    return aggregate(items, sessions, now, learned_streak_threshold, utc_offset_minutes);
}

ProgressStats ProgressAggregator::aggregate(const std::vector<VocabItem>& items,
    const std::vector<DrillSession>& sessions, std::time_t now,
    int learnedStreakThreshold, int utcOffsetMinutes) {
    ProgressStats stats;
    stats.total_vocab_count = items.size();

    for (const auto& item : items) {
        if (!item.schedule) continue;

        if (item.schedule->streak >= learnedStreakThreshold) {
            stats.learned_vocab_count += 1;
        }
        if (item.schedule->due_at <= now) {
            stats.review_due_count += 1;
        }
    }

    for (const auto& s : sessions) {
        if (!stats.last_session_at || s.ended_at > *stats.last_session_at) {
            stats.last_session_at = s.ended_at;
        }
    }

    stats.streak_days = streakDays(sessions, now, utcOffsetMinutes);

    spdlog::debug("Progress: total={} learned={} due={} streakDays={} sessions={}",
        stats.total_vocab_count, stats.learned_vocab_count, stats.review_due_count,
        stats.streak_days, sessions.size());

    return stats;
}

int ProgressAggregator::streakDays(const std::vector<DrillSession>& sessions, std::time_t now, int utcOffsetMinutes) {
    if (sessions.empty()) return 0;

    std::unordered_set<std::int64_t> activeDays;
    activeDays.reserve(sessions.size());
    for (const auto& s : sessions) {
        activeDays.insert(TimeUtils::dayIndex(s.ended_at, utcOffsetMinutes));
    }

    int streak = 0;
    std::int64_t cursor = TimeUtils::dayIndex(now, utcOffsetMinutes);
    while (activeDays.count(cursor) > 0) {
        ++streak;
        --cursor;
    }
    return streak;
}

std::vector<const VocabItem*> ProgressAggregator::weakItems(const std::vector<VocabItem>& items, std::size_t limit) {
    std::vector<const VocabItem*> ordered;
    ordered.reserve(items.size());
    for (const auto& item : items) ordered.push_back(&item);

    std::stable_sort(ordered.begin(), ordered.end(),
        [](const VocabItem* a, const VocabItem* b) {
            const int sa = a->schedule ? a->schedule->streak : -1;
            const int sb = b->schedule ? b->schedule->streak : -1;
            if (sa != sb) return sa < sb;

            const std::time_t da = a->schedule ? a->schedule->due_at : 0;
            const std::time_t db = b->schedule ? b->schedule->due_at : 0;
            return da < db;
        });

    if (ordered.size() > limit) ordered.resize(limit);
    return ordered;
}

WeeklyActivity ProgressAggregator::weeklyActivity(const std::vector<DrillSession>& sessions, std::time_t now, int days) const {
    WeeklyActivity activity;
    if (days <= 0) return activity;

    const std::int64_t today = TimeUtils::dayIndex(now, utc_offset_minutes);
    const std::int64_t first = today - (days - 1);

    std::vector<double> minutes(static_cast<std::size_t>(days), 0.0);
    for (const auto& s : sessions) {
        const std::int64_t day = TimeUtils::dayIndex(s.ended_at, utc_offset_minutes);
        if (day < first || day > today) continue;
        minutes[static_cast<std::size_t>(day - first)] += s.minutes();
    }

    double total = 0.0;
    activity.points.reserve(minutes.size());
    for (std::size_t i = 0; i < minutes.size(); ++i) {
        ActivityPoint p;
        p.day_index = first + static_cast<std::int64_t>(i);
        p.label = TimeUtils::weekdayLabel(p.day_index);
        p.minutes = TimeUtils::roundTo(minutes[i], 1);
        total += p.minutes;
        activity.points.push_back(std::move(p));
    }
    activity.total_minutes = TimeUtils::roundTo(total, 1);
    return activity;
}
