#pragma once
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "DrillSession.hpp"
#include "VocabItem.hpp"

// Recomputed from scratch on every call.
struct ProgressStats {
    std::size_t total_vocab_count = 0;
    std::size_t learned_vocab_count = 0;
    std::size_t review_due_count = 0;
    int streak_days = 0;
    std::optional<std::time_t> last_session_at;
};

struct ActivityPoint {
    std::int64_t day_index = 0;
    std::string label;          // "Mon".."Sun"
    double minutes = 0.0;
};

struct WeeklyActivity {
    std::vector<ActivityPoint> points;   // oldest day first
    double total_minutes = 0.0;
};

class ProgressAggregator {
public:
    static constexpr int DEFAULT_LEARNED_STREAK_THRESHOLD = 3;
    static constexpr std::size_t DEFAULT_WEAK_ITEM_LIMIT = 10;

    explicit ProgressAggregator(int learnedStreakThreshold = DEFAULT_LEARNED_STREAK_THRESHOLD,
        int utcOffsetMinutes = 0);

    ProgressStats aggregate(const std::vector<VocabItem>& items,
        const std::vector<DrillSession>& sessions, std::time_t now) const;

    static ProgressStats aggregate(const std::vector<VocabItem>& items,
        const std::vector<DrillSession>& sessions, std::time_t now,
        int learnedStreakThreshold, int utcOffsetMinutes);

    // Consecutive calendar days with a session, walking back from now's day.
    // A miss on now's own day means 0.
    static int streakDays(const std::vector<DrillSession>& sessions, std::time_t now, int utcOffsetMinutes = 0);

    // Lowest streak first (unscheduled before everything), then earliest due
    static std::vector<const VocabItem*> weakItems(const std::vector<VocabItem>& items,
        std::size_t limit = DEFAULT_WEAK_ITEM_LIMIT);

    WeeklyActivity weeklyActivity(const std::vector<DrillSession>& sessions, std::time_t now, int days = 7) const;

private:
    int learned_streak_threshold;
    int utc_offset_minutes;
};
