#include "QueueBuilder.hpp"
#include "TimeUtils.hpp"
#include <algorithm>

QueueBuilder::QueueBuilder(double upcomingWindowHours)
    : upcoming_window_hours(upcomingWindowHours)
{
}

PracticeQueue QueueBuilder::build(const std::vector<VocabItem>& items, std::time_t now,
    std::optional<std::size_t> limit) const {
    return buildQueue(items, now, limit, upcoming_window_hours);
}

PracticeQueue QueueBuilder::buildQueue(const std::vector<VocabItem>& items, std::time_t now,
    std::optional<std::size_t> limit, double upcomingWindowHours) {
    std::vector<const VocabItem*> due, upcoming, fresh, later;

    for (const auto& item : items) {
        if (!item.schedule) {
            fresh.push_back(&item);
            continue;
        }

        const long long hoursUntilDue = TimeUtils::wholeHoursBetween(now, item.schedule->due_at);
        if (hoursUntilDue <= 0) {
            due.push_back(&item);
        }
        else if (static_cast<double>(hoursUntilDue) <= upcomingWindowHours) {
            upcoming.push_back(&item);
        }
        else {
            later.push_back(&item);
        }
    }

    auto byDue = [](const VocabItem* a, const VocabItem* b) {
        return a->schedule->due_at < b->schedule->due_at;
    };
    auto byCreated = [](const VocabItem* a, const VocabItem* b) {
        return a->created_at < b->created_at;
    };

    std::stable_sort(due.begin(), due.end(), byDue);
    std::stable_sort(upcoming.begin(), upcoming.end(), byDue);
    std::stable_sort(fresh.begin(), fresh.end(), byCreated);
    std::stable_sort(later.begin(), later.end(), byDue);

    PracticeQueue result;
    result.due_count = due.size();
    result.upcoming_count = upcoming.size();
    result.new_count = fresh.size();

    const std::size_t cap = limit.value_or(items.size());
    result.queue.reserve(std::min(cap, items.size()));

    for (const auto* bucket : { &due, &upcoming, &fresh, &later }) {
        for (const VocabItem* item : *bucket) {
            if (result.queue.size() >= cap) break;
            result.queue.push_back(item);
        }
    }

    spdlog::debug("Queue built: due={} upcoming={} new={} later={} -> {} of limit {}",
        due.size(), upcoming.size(), fresh.size(), later.size(), result.queue.size(), cap);

    return result;
}
