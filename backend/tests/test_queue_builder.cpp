#include "test_suite.hpp"

#include "../src/core/QueueBuilder.hpp"

#include <vector>

namespace {

VocabItem scheduled(const std::string& id, std::time_t dueAt, std::time_t createdAt = 0) {
  VocabItem item;
  item.id = id;
  item.created_at = createdAt;
  ScheduleState s;
  s.due_at = dueAt;
  s.streak = 1;
  item.schedule = s;
  return item;
}

VocabItem unscheduled(const std::string& id, std::time_t createdAt) {
  VocabItem item;
  item.id = id;
  item.created_at = createdAt;
  return item;
}

std::vector<std::string> ids(const PracticeQueue& q) {
  std::vector<std::string> out;
  for (const auto* item : q.queue) out.push_back(item->id);
  return out;
}

} // namespace

int main() {
  TestSuite suite;
  const std::time_t now = at("2025-06-15T12:00:00Z");
  const std::time_t hour = TimeUtils::SECONDS_PER_HOUR;

  // one item per bucket
  {
    std::vector<VocabItem> items = {
      scheduled("far", now + 48 * hour),
      unscheduled("new", now - 24 * hour),
      scheduled("soon", now + 3 * hour),
      scheduled("overdue", now - 2 * hour),
    };
    PracticeQueue q = QueueBuilder::buildQueue(items, now, 10, 12.0);
    suite.require((ids(q) == std::vector<std::string>{ "overdue", "soon", "new", "far" }),
                  "queue orders due, upcoming, new, later");
    suite.require(q.due_count == 1 && q.upcoming_count == 1 && q.new_count == 1, "bucket counts");
  }

  // ordering inside buckets
  {
    std::vector<VocabItem> items = {
      scheduled("due-1h", now - 1 * hour),
      scheduled("due-5h", now - 5 * hour),
      unscheduled("new-late", now - 1 * hour),
      unscheduled("new-early", now - 10 * hour),
      scheduled("up-10h", now + 10 * hour),
      scheduled("up-2h", now + 2 * hour),
      scheduled("later-100h", now + 100 * hour),
      scheduled("later-20h", now + 20 * hour),
    };
    QueueBuilder builder;
    PracticeQueue q = builder.build(items, now);
    suite.require((ids(q) == std::vector<std::string>{ "due-5h", "due-1h", "up-2h", "up-10h",
                                                       "new-early", "new-late", "later-20h", "later-100h" }),
                  "each bucket sorted ascending");
    suite.require(q.queue.size() == items.size(), "default limit is the collection size");
  }

  // counts are taken before truncation
  {
    std::vector<VocabItem> items;
    for (int i = 0; i < 12; ++i) items.push_back(scheduled("d" + std::to_string(i), now - (i + 1) * hour));
    items.push_back(unscheduled("n", now));
    PracticeQueue q = QueueBuilder::buildQueue(items, now, 10, 12.0);
    suite.require(q.queue.size() == 10, "queue truncated to limit");
    suite.require(q.due_count == 12, "due count reflects the full bucket");
    suite.require(q.new_count == 1, "new count reflects the full bucket");
    suite.require(q.queue.front()->id == "d11", "most overdue first");

    PracticeQueue none = QueueBuilder::buildQueue(items, now, 0, 12.0);
    suite.require(none.queue.empty() && none.due_count == 12, "zero limit yields empty queue with counts");
  }

  // window edges
  {
    std::vector<VocabItem> items = {
      scheduled("exactly-now", now),
      scheduled("half-hour", now + hour / 2),
      scheduled("edge", now + 12 * hour),
      scheduled("past-edge", now + 13 * hour),
    };
    PracticeQueue q = QueueBuilder::buildQueue(items, now, std::nullopt, 12.0);
    suite.require(q.due_count == 2, "due now and within the current hour count as due");
    suite.require(q.upcoming_count == 1, "window end is inclusive");
    suite.require(q.queue.back()->id == "past-edge", "beyond the window is later");

    PracticeQueue narrow = QueueBuilder::buildQueue(items, now, std::nullopt, 0.0);
    suite.require(narrow.upcoming_count == 0, "zero window has no upcoming items");
  }

  // ties keep input order, inputs untouched
  {
    std::vector<VocabItem> items = {
      scheduled("b", now - hour),
      scheduled("a", now - hour),
      unscheduled("y", now),
      unscheduled("x", now),
    };
    PracticeQueue q = QueueBuilder::buildQueue(items, now, std::nullopt, 12.0);
    suite.require((ids(q) == std::vector<std::string>{ "b", "a", "y", "x" }), "stable ordering on ties");
    suite.require(items[0].id == "b" && items[3].id == "x", "input collection is not reordered");

    PracticeQueue again = QueueBuilder::buildQueue(items, now, std::nullopt, 12.0);
    suite.require(ids(again) == ids(q), "deterministic for identical input");
  }

  // empty input
  {
    std::vector<VocabItem> items;
    PracticeQueue q = QueueBuilder::buildQueue(items, now, 10, 12.0);
    suite.require(q.queue.empty() && q.due_count == 0 && q.upcoming_count == 0 && q.new_count == 0,
                  "empty collection gives an empty queue");
  }

  return finish(suite, "QueueBuilder");
}
