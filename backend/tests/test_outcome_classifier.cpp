#include "test_suite.hpp"

#include "../src/core/Mastery.hpp"
#include "../src/core/OutcomeClassifier.hpp"

#include <limits>
#include <stdexcept>

namespace {

ActivityOutcome recognition(bool correct, std::time_t when) {
  ActivityOutcome o;
  o.activity_type = ActivityType::Recognition;
  o.was_correct = correct;
  o.attempted_at = when;
  return o;
}

ActivityOutcome production(bool correct, std::optional<double> score, std::time_t when) {
  ActivityOutcome o;
  o.activity_type = ActivityType::Production;
  o.was_correct = correct;
  o.score = score;
  o.attempted_at = when;
  return o;
}

VocabItem withCounts(int rc, int ri, int pc, int pi) {
  VocabItem item;
  item.id = "v";
  PerformanceCounters p;
  p.recognition.correct_count = rc;
  p.recognition.incorrect_count = ri;
  p.production.correct_count = pc;
  p.production.incorrect_count = pi;
  item.performance = p;
  return item;
}

} // namespace

int main() {
  TestSuite suite;
  const std::time_t t0 = at("2025-03-10T08:00:00Z");
  OutcomeClassifier classifier;

  // quality mapping
  {
    suite.require(classifier.qualityFor(recognition(true, t0)) == 4, "correct recognition grades 4");
    suite.require(classifier.qualityFor(recognition(false, t0)) == 2, "incorrect recognition grades 2");

    suite.require(classifier.qualityFor(production(true, 0.95, t0)) == 5, "score 0.95 grades 5");
    suite.require(classifier.qualityFor(production(true, 0.9, t0)) == 5, "score 0.9 grades 5");
    suite.require(classifier.qualityFor(production(true, 0.75, t0)) == 4, "score 0.75 grades 4");
    suite.require(classifier.qualityFor(production(true, 0.55, t0)) == 3, "score 0.55 grades 3");
    suite.require(classifier.qualityFor(production(false, 0.35, t0)) == 2, "score 0.35 grades 2");
    suite.require(classifier.qualityFor(production(false, 0.1, t0)) == 1, "score 0.1 grades 1");

    suite.require(classifier.qualityFor(production(true, 0.1, t0)) == 3, "correct answer is never graded below 3");
    suite.require(classifier.qualityFor(production(false, 0.95, t0)) == 2, "incorrect answer is never graded 3 or above");

    suite.require(classifier.qualityFor(production(true, std::nullopt, t0)) == 4, "production without score falls back to binary");
    suite.require(classifier.qualityFor(production(false, std::nullopt, t0)) == 2, "production without score falls back to binary");
    suite.require(classifier.qualityFor(production(true, 7.5, t0)) == 5, "scores above 1 are clamped");
    suite.require(classifier.qualityFor(production(false, -3.0, t0)) == 1, "scores below 0 are clamped");
    suite.require(classifier.qualityFor(production(true, std::numeric_limits<double>::quiet_NaN(), t0)) == 4,
                  "non-finite score is treated as absent");
  }

  // applyOutcome on a fresh item
  {
    VocabItem item;
    item.id = "fresh";
    OutcomeUpdate u = classifier.applyOutcome(item, recognition(true, t0));
    suite.require(u.performance.recognition.correct_count == 1, "recognition correct is counted");
    suite.require(u.performance.recognition.incorrect_count == 0, "no incorrect counted");
    suite.require(u.performance.recognition.last_attempt_at == t0, "lastAttemptAt set");
    suite.require(u.performance.production.total() == 0, "production bucket untouched");
    suite.require(!u.performance.production.last_attempt_at, "production lastAttemptAt untouched");
    suite.require(u.schedule.streak == 1, "schedule created with streak 1");
    suite.require(u.schedule.due_at == t0 + TimeUtils::SECONDS_PER_DAY, "due one day later");
    suite.require(u.quality == 4 && u.was_successful, "update reports quality and success");
  }

  // applyOutcome keeps the other bucket and chains the schedule
  {
    VocabItem item = withCounts(3, 1, 0, 0);
    item.performance->recognition.last_attempt_at = t0 - 100;
    ScheduleState s;
    s.streak = 1;
    s.interval_hours = 24;
    s.ease_factor = 2.5;
    s.due_at = t0;
    item.schedule = s;

    OutcomeUpdate u = classifier.applyOutcome(item, production(false, 0.2, t0));
    suite.require(u.performance.production.incorrect_count == 1, "production incorrect counted");
    suite.require(u.performance.recognition.correct_count == 3 && u.performance.recognition.incorrect_count == 1,
                  "recognition counts unchanged");
    suite.require(u.performance.recognition.last_attempt_at == t0 - 100, "recognition lastAttemptAt unchanged");
    suite.require(u.schedule.streak == 0, "failed production resets the streak");
    suite.require(!u.was_successful, "failure reported");
    suite.require(item.performance->production.total() == 0, "input item is not mutated");
  }

  // custom policy and validation
  {
    QualityPolicy policy;
    policy.good_threshold = 0.8;
    policy.pass_threshold = 0.6;
    policy.poor_threshold = 0.4;
    OutcomeClassifier strict(policy);
    suite.require(strict.qualityFor(production(true, 0.75, t0)) == 3, "custom breakpoints are used");
    suite.require(strict.qualityFor(production(true, 0.9, t0)) == 5, "0.9 still earns the top grade");

    QualityPolicy lenient;
    lenient.perfect_threshold = 0.85;
    OutcomeClassifier loose(lenient);
    suite.require(loose.qualityFor(production(true, 0.9, t0)) == 5, "lower perfect threshold keeps 0.9 at 5");
    suite.require(loose.qualityFor(production(true, 0.86, t0)) == 5, "lower perfect threshold applies");

    auto rejected = [](const QualityPolicy& p) {
      try {
        OutcomeClassifier bad(p);
      }
      catch (const std::invalid_argument&) {
        return true;
      }
      return false;
    };

    QualityPolicy broken;
    broken.good_threshold = 0.95;
    suite.require(rejected(broken), "non-descending thresholds are rejected");

    QualityPolicy tooStrict;
    tooStrict.perfect_threshold = 0.95;
    tooStrict.good_threshold = 0.8;
    tooStrict.pass_threshold = 0.6;
    tooStrict.poor_threshold = 0.4;
    suite.require(rejected(tooStrict), "perfect threshold above 0.9 is rejected");

    QualityPolicy weakCorrect;
    weakCorrect.correct_grade = 3;
    suite.require(rejected(weakCorrect), "correct grade below 4 is rejected");

    QualityPolicy topCorrect;
    topCorrect.correct_grade = 5;
    OutcomeClassifier top(topCorrect);
    suite.require(top.qualityFor(recognition(true, t0)) == 5, "correct grade 5 is accepted");
  }

  // mastery blend decision table
  {
    VocabItem none;
    suite.require(!Mastery::masteryLevel(none), "no performance gives null mastery");
    suite.require(!Mastery::masteryLevel(withCounts(0, 0, 0, 0)), "empty buckets give null mastery");
    suite.require(Mastery::basisOf(withCounts(0, 0, 0, 0).performance) == Mastery::Basis::None, "basis none");

    auto recOnly = Mastery::masteryLevel(withCounts(3, 1, 0, 0));
    suite.require(recOnly && near(*recOnly, 0.75), "recognition-only mastery is its accuracy");

    auto prodOnly = Mastery::masteryLevel(withCounts(0, 0, 1, 1));
    suite.require(prodOnly && near(*prodOnly, 0.5), "production-only mastery is its accuracy");

    auto both = Mastery::masteryLevel(withCounts(8, 2, 7, 3));
    suite.require(both && near(*both, 0.74), "blend is 0.4 recognition + 0.6 production");
    suite.require(Mastery::basisOf(withCounts(8, 2, 7, 3).performance) == Mastery::Basis::Both, "basis both");
  }

  // mastered needs accuracy and durability
  {
    VocabItem item = withCounts(9, 1, 9, 1);
    suite.require(!Mastery::isMastered(item), "no schedule is never mastered");

    ScheduleState s;
    s.streak = 2;
    item.schedule = s;
    suite.require(!Mastery::isMastered(item), "streak 2 is not durable enough");

    item.schedule->streak = 3;
    suite.require(Mastery::isMastered(item), "accuracy 0.9 with streak 3 is mastered");

    VocabItem lucky = withCounts(1, 0, 0, 0);
    lucky.schedule = s;
    lucky.schedule->streak = 1;
    suite.require(!Mastery::isMastered(lucky), "one lucky answer is not mastery");

    VocabItem weak = withCounts(5, 5, 5, 5);
    weak.schedule = s;
    weak.schedule->streak = 5;
    suite.require(!Mastery::isMastered(weak), "low accuracy is not mastery");
  }

  // due queries
  {
    VocabItem item;
    suite.require(!Mastery::daysUntilDue(item, t0), "no schedule has no due distance");
    suite.require(!Mastery::isDue(item, t0), "no schedule is never due");

    ScheduleState s;
    s.due_at = t0 + 36 * TimeUtils::SECONDS_PER_HOUR;
    item.schedule = s;
    auto days = Mastery::daysUntilDue(item, t0);
    suite.require(days && near(*days, 1.5), "36 hours is 1.5 days");
    suite.require(!Mastery::isDue(item, t0), "future item is not due");

    item.schedule->due_at = t0 - 2 * TimeUtils::SECONDS_PER_DAY;
    days = Mastery::daysUntilDue(item, t0);
    suite.require(days && near(*days, -2.0), "overdue is negative");
    suite.require(Mastery::isDue(item, t0), "overdue item is due");

    item.schedule->due_at = t0;
    suite.require(Mastery::isDue(item, t0), "due exactly now counts as due");
  }

  // summary
  {
    VocabItem item = withCounts(8, 2, 7, 3);
    ScheduleState s;
    s.streak = 4;
    s.due_at = t0 + TimeUtils::SECONDS_PER_DAY;
    item.schedule = s;
    auto summary = Mastery::performanceSummary(item, t0);
    suite.require(summary.recognition.total == 10, "summary recognition total");
    suite.require(summary.production.accuracy && near(*summary.production.accuracy, 0.7), "summary production accuracy");
    suite.require(summary.overall.streak == 4, "summary streak");
    suite.require(!summary.overall.is_mastered, "0.74 mastery is below threshold");
    suite.require(summary.overall.days_until_due && near(*summary.overall.days_until_due, 1.0), "summary days until due");
  }

  return finish(suite, "OutcomeClassifier");
}
