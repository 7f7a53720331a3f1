#pragma once
#include <cstddef>
#include <ctime>
#include <optional>
#include <vector>
#include <spdlog/spdlog.h>
#include "VocabItem.hpp"

struct PracticeQueue {
    std::vector<const VocabItem*> queue;  // points into the caller's collection
    std::size_t due_count = 0;            // bucket sizes before truncation
    std::size_t upcoming_count = 0;
    std::size_t new_count = 0;
};

/*
  Orders a practice session: due ++ upcoming ++ new ++ later, truncated to limit.
   - due/upcoming/later by due_at ascending (most overdue first)
   - new (never scheduled) by created_at ascending
  Sorting is stable, so ties keep input order.
*/
class QueueBuilder {
public:
    static constexpr double DEFAULT_UPCOMING_WINDOW_HOURS = 12.0;

    explicit QueueBuilder(double upcomingWindowHours = DEFAULT_UPCOMING_WINDOW_HOURS);

    PracticeQueue build(const std::vector<VocabItem>& items, std::time_t now,
        std::optional<std::size_t> limit = std::nullopt) const;

    static PracticeQueue buildQueue(const std::vector<VocabItem>& items, std::time_t now,
        std::optional<std::size_t> limit, double upcomingWindowHours);

private:
    double upcoming_window_hours;
};
