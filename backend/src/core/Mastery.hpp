#pragma once
#include <ctime>
#include <optional>
#include "ScheduleState.hpp"
#include "VocabItem.hpp"

// Read-only queries over an item's performance and schedule.
namespace Mastery
{
    constexpr double RECOGNITION_WEIGHT = 0.4;
    constexpr double PRODUCTION_WEIGHT = 0.6;
    constexpr double MASTERED_LEVEL = 0.8;
    constexpr int MASTERED_STREAK = 3;

    // Which skill buckets have any attempts
    enum class Basis {
        None,
        RecognitionOnly,
        ProductionOnly,
        Both
    };

    Basis basisOf(const std::optional<PerformanceCounters>& performance);

    // [0,1], or nullopt when neither bucket has attempts
    std::optional<double> masteryLevel(const std::optional<PerformanceCounters>& performance);
    std::optional<double> masteryLevel(const VocabItem& item);

    // Accuracy and durability both required
    bool isMastered(const VocabItem& item);

    // Signed, one decimal; negative means overdue
    std::optional<double> daysUntilDue(const VocabItem& item, std::time_t now);
    bool isDue(const VocabItem& item, std::time_t now);

    struct SkillSummary {
        int correct = 0;
        int incorrect = 0;
        int total = 0;
        std::optional<double> accuracy;
    };

    struct OverallSummary {
        std::optional<double> mastery;
        bool is_mastered = false;
        int streak = 0;
        std::optional<double> days_until_due;
        bool is_due = false;
    };

    struct PerformanceSummary {
        SkillSummary recognition;
        SkillSummary production;
        OverallSummary overall;
    };

    PerformanceSummary performanceSummary(const VocabItem& item, std::time_t now);
}
