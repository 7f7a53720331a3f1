#include "ScheduleState.hpp"

const char* activityTypeName(ActivityType type) {
    switch (type) {
    case ActivityType::Recognition: return "recognition";
    case ActivityType::Production: return "production";
    }
    return "recognition";
}

std::optional<double> SkillCounters::accuracy() const {
    const int n = total();
    if (n <= 0) return std::nullopt;
    return static_cast<double>(correct_count) / static_cast<double>(n);
}

SkillCounters& PerformanceCounters::bucket(ActivityType type) {
    switch (type) {
    case ActivityType::Recognition: return recognition;
    case ActivityType::Production: return production;
    }
    return recognition;
}

const SkillCounters& PerformanceCounters::bucket(ActivityType type) const {
    switch (type) {
    case ActivityType::Recognition: return recognition;
    case ActivityType::Production: return production;
    }
    return recognition;
}
