#pragma once
#include <optional>
#include <spdlog/spdlog.h>
#include "ScheduleState.hpp"
#include "Scheduler.hpp"
#include "VocabItem.hpp"

// Breakpoints quantizing a continuous production score into an SM-2 grade.
// Monotonic: score >= perfect -> 5, >= good -> 4, >= pass -> 3, >= poor -> 2, else 1.
struct QualityPolicy {
    static constexpr double MAX_PERFECT_THRESHOLD = 0.9;
    static constexpr int MIN_CORRECT_GRADE = 4;

    double perfect_threshold = 0.9;
    double good_threshold = 0.7;
    double pass_threshold = 0.5;
    double poor_threshold = 0.3;

    int correct_grade = 4;      // binary signal, clearly successful
    int incorrect_grade = 2;    // binary signal, clearly failed

    void validate() const;
};

struct OutcomeUpdate {
    ScheduleState schedule;
    PerformanceCounters performance;
    int quality = 0;
    bool was_successful = false;
};

class OutcomeClassifier {
public:
    OutcomeClassifier();
    explicit OutcomeClassifier(QualityPolicy policy, Scheduler scheduler = Scheduler());

    OutcomeUpdate applyOutcome(const VocabItem& item, const ActivityOutcome& outcome) const;
    OutcomeUpdate applyOutcome(const std::optional<ScheduleState>& schedule,
        const std::optional<PerformanceCounters>& performance,
        const ActivityOutcome& outcome) const;

    // Always in [0,5]
    int qualityFor(const ActivityOutcome& outcome) const;

    static PerformanceCounters updatePerformance(const std::optional<PerformanceCounters>& previous,
        const ActivityOutcome& outcome);

    const QualityPolicy& policy() const noexcept { return policy_; }

private:
    QualityPolicy policy_;
    Scheduler scheduler_;

    int binaryQuality(bool wasCorrect) const;
    int gradedQuality(double score, bool wasCorrect) const;
};
