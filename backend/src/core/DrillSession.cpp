#include "DrillSession.hpp"
#include <algorithm>

double DrillSession::minutes() const {
    const std::time_t diff = std::max<std::time_t>(ended_at - started_at, 0);
    return static_cast<double>(diff) / 60.0;
}

std::optional<double> DrillSession::accuracy() const {
    const int total = correct_count + incorrect_count;
    if (total <= 0) return std::nullopt;
    return static_cast<double>(correct_count) / static_cast<double>(total);
}
