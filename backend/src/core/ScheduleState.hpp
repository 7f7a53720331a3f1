#pragma once
#include <ctime>
#include <optional>
#include <string>

// Spaced-repetition bookkeeping for one vocabulary item.
// Replaced wholesale on every review, never merged.
struct ScheduleState {
    std::string algorithm = "sm2";
    int streak = 0;                  // consecutive successful reviews
    double interval_hours = 0.0;
    double ease_factor = 2.5;
    std::time_t due_at = 0;
    std::optional<std::time_t> last_reviewed_at;
};

struct ReviewResult {
    ScheduleState schedule;
    bool was_successful = false;
};

// Passive recall (judging a shown term) vs. active recall (producing it).
enum class ActivityType {
    Recognition,
    Production
};

const char* activityTypeName(ActivityType type);

struct SkillCounters {
    int correct_count = 0;
    int incorrect_count = 0;
    std::optional<std::time_t> last_attempt_at;

    int total() const { return correct_count + incorrect_count; }
    std::optional<double> accuracy() const;
};

struct PerformanceCounters {
    SkillCounters recognition;
    SkillCounters production;

    SkillCounters& bucket(ActivityType type);
    const SkillCounters& bucket(ActivityType type) const;
};

// One learner action, consumed immediately by the classifier.
struct ActivityOutcome {
    ActivityType activity_type = ActivityType::Recognition;
    bool was_correct = false;
    std::optional<double> score;   // [0,1], production only
    std::time_t attempted_at = 0;
};
