#pragma once
#include <string>
#include <ctime>
#include <optional>
#include <vector>
#include <spdlog/spdlog.h>
#include "ScheduleState.hpp"

class VocabItem {
public:
    VocabItem() = default;
    VocabItem(const std::string& term, const std::string& meaning, std::time_t createdAt);

    // Basic fields
    std::string id;          // Auto-generated
    std::string term;
    std::string meaning;
    std::time_t created_at = 0;
    std::time_t updated_at = 0;

    // Absent until the first review
    std::optional<ScheduleState> schedule;
    std::optional<PerformanceCounters> performance;

    // Tags
    std::vector<std::string> tags;

    // Tag helpers
    void addTag(const std::string& tag);
    bool removeTag(const std::string& tag); // returns true if removed
    bool hasTag(const std::string& tag) const;
    void setTags(const std::vector<std::string>& newTags);
    std::string tagsAsLine() const; // comma-separated, for display

    // Utility
    static std::string generateID();
    static std::vector<std::string> splitTagsLine(const std::string& line);
};
