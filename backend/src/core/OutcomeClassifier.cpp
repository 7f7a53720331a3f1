#include "OutcomeClassifier.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

void QualityPolicy::validate() const {
    const double thresholds[] = { perfect_threshold, good_threshold, pass_threshold, poor_threshold };
    for (double t : thresholds) {
        if (!std::isfinite(t) || t < 0.0 || t > 1.0) {
            throw std::invalid_argument("quality thresholds must be within [0, 1]");
        }
    }
    if (!(perfect_threshold > good_threshold && good_threshold > pass_threshold && pass_threshold > poor_threshold)) {
        throw std::invalid_argument("quality thresholds must be strictly descending");
    }
    // a score of 0.9 always earns the top grade
    if (perfect_threshold > MAX_PERFECT_THRESHOLD) {
        throw std::invalid_argument("perfect_threshold must not exceed 0.9");
    }
    if (correct_grade < MIN_CORRECT_GRADE || correct_grade > Scheduler::MAX_QUALITY) {
        throw std::invalid_argument("correct_grade must be 4 or 5");
    }
    if (incorrect_grade < Scheduler::MIN_QUALITY || incorrect_grade >= Scheduler::SUCCESS_QUALITY) {
        throw std::invalid_argument("incorrect_grade must be a failing grade (0..2)");
    }
}

OutcomeClassifier::OutcomeClassifier() {
    policy_.validate();
}

OutcomeClassifier::OutcomeClassifier(QualityPolicy policy, Scheduler scheduler)
    : policy_(std::move(policy)), scheduler_(std::move(scheduler))
{
    policy_.validate();
}

OutcomeUpdate OutcomeClassifier::applyOutcome(const VocabItem& item, const ActivityOutcome& outcome) const {
    spdlog::debug("applyOutcome item={} type={} correct={}", item.id,
        activityTypeName(outcome.activity_type), outcome.was_correct);
    return applyOutcome(item.schedule, item.performance, outcome);
}

OutcomeUpdate OutcomeClassifier::applyOutcome(const std::optional<ScheduleState>& schedule,
    const std::optional<PerformanceCounters>& performance,
    const ActivityOutcome& outcome) const {
    OutcomeUpdate update;
    update.quality = qualityFor(outcome);
    update.performance = updatePerformance(performance, outcome);

    ReviewResult review = scheduler_.nextSchedule(update.quality, outcome.attempted_at, schedule);
    update.schedule = std::move(review.schedule);
    update.was_successful = review.was_successful;

    return update;
}

int OutcomeClassifier::qualityFor(const ActivityOutcome& outcome) const {
    int quality = policy_.correct_grade;

    switch (outcome.activity_type) {
    case ActivityType::Recognition:
        quality = binaryQuality(outcome.was_correct);
        break;
    case ActivityType::Production:
        if (outcome.score && std::isfinite(*outcome.score)) {
            quality = gradedQuality(*outcome.score, outcome.was_correct);
        }
        else {
            quality = binaryQuality(outcome.was_correct);
        }
        break;
    }

    return std::clamp(quality, Scheduler::MIN_QUALITY, Scheduler::MAX_QUALITY);
}

PerformanceCounters OutcomeClassifier::updatePerformance(const std::optional<PerformanceCounters>& previous,
    const ActivityOutcome& outcome) {
    PerformanceCounters next = previous.value_or(PerformanceCounters{});

    SkillCounters& bucket = next.bucket(outcome.activity_type);
    if (outcome.was_correct) bucket.correct_count += 1;
    else bucket.incorrect_count += 1;
    bucket.last_attempt_at = outcome.attempted_at;

    return next;
}

int OutcomeClassifier::binaryQuality(bool wasCorrect) const {
    return wasCorrect ? policy_.correct_grade : policy_.incorrect_grade;
}

int OutcomeClassifier::gradedQuality(double score, bool wasCorrect) const {
    score = std::clamp(score, 0.0, 1.0);

    int grade = 1;
    if (score >= policy_.perfect_threshold) grade = 5;
    else if (score >= policy_.good_threshold) grade = 4;
    else if (score >= policy_.pass_threshold) grade = 3;
    else if (score >= policy_.poor_threshold) grade = 2;

    // wasCorrect decides which side of the success boundary the grade lands on
    if (wasCorrect && grade < Scheduler::SUCCESS_QUALITY) {
        spdlog::debug("score {:.2f} graded {} but marked correct; raising to {}", score, grade, Scheduler::SUCCESS_QUALITY);
        grade = Scheduler::SUCCESS_QUALITY;
    }
    else if (!wasCorrect && grade >= Scheduler::SUCCESS_QUALITY) {
        spdlog::debug("score {:.2f} graded {} but marked incorrect; lowering to {}", score, grade, Scheduler::SUCCESS_QUALITY - 1);
        grade = Scheduler::SUCCESS_QUALITY - 1;
    }
    return grade;
}
