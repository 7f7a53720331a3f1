#include "Mastery.hpp"
#include "TimeUtils.hpp"

namespace
{
    Mastery::SkillSummary summarize(const std::optional<PerformanceCounters>& perf, ActivityType type) {
        Mastery::SkillSummary s;
        if (!perf) return s;
        const SkillCounters& b = perf->bucket(type);
        s.correct = b.correct_count;
        s.incorrect = b.incorrect_count;
        s.total = b.total();
        s.accuracy = b.accuracy();
        return s;
    }
}

namespace Mastery
{
    Basis basisOf(const std::optional<PerformanceCounters>& performance) {
        if (!performance) return Basis::None;

        const bool hasRecognition = performance->recognition.total() > 0;
        const bool hasProduction = performance->production.total() > 0;

        if (hasRecognition && hasProduction) return Basis::Both;
        if (hasRecognition) return Basis::RecognitionOnly;
        if (hasProduction) return Basis::ProductionOnly;
        return Basis::None;
    }

    std::optional<double> masteryLevel(const std::optional<PerformanceCounters>& performance) {
        switch (basisOf(performance)) {
        case Basis::None:
            return std::nullopt;
        case Basis::RecognitionOnly:
            return performance->recognition.accuracy();
        case Basis::ProductionOnly:
            return performance->production.accuracy();
        case Basis::Both:
            return *performance->recognition.accuracy() * RECOGNITION_WEIGHT
                + *performance->production.accuracy() * PRODUCTION_WEIGHT;
        }
        return std::nullopt;
    }

    std::optional<double> masteryLevel(const VocabItem& item) {
        return masteryLevel(item.performance);
    }

    bool isMastered(const VocabItem& item) {
        const auto level = masteryLevel(item);
        if (!level || *level < MASTERED_LEVEL) return false;
        return item.schedule && item.schedule->streak >= MASTERED_STREAK;
    }

    std::optional<double> daysUntilDue(const VocabItem& item, std::time_t now) {
        if (!item.schedule) return std::nullopt;
        const double diffDays = static_cast<double>(item.schedule->due_at - now)
            / static_cast<double>(TimeUtils::SECONDS_PER_DAY);
        return TimeUtils::roundTo(diffDays, 1);
    }

    bool isDue(const VocabItem& item, std::time_t now) {
        if (!item.schedule) return false;
        return item.schedule->due_at <= now;
    }

    PerformanceSummary performanceSummary(const VocabItem& item, std::time_t now) {
        PerformanceSummary summary;
        summary.recognition = summarize(item.performance, ActivityType::Recognition);
        summary.production = summarize(item.performance, ActivityType::Production);
        summary.overall.mastery = masteryLevel(item);
        summary.overall.is_mastered = isMastered(item);
        summary.overall.streak = item.schedule ? item.schedule->streak : 0;
        summary.overall.days_until_due = daysUntilDue(item, now);
        summary.overall.is_due = isDue(item, now);
        return summary;
    }
}
