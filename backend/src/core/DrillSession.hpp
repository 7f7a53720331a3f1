#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <vector>

// A completed practice session. Produced by the caller, only aggregated here.
struct DrillSession {
    std::string id;
    std::vector<std::string> vocab_item_ids;
    std::time_t started_at = 0;
    std::time_t ended_at = 0;
    double score = 0.0;        // normalized [0,1]
    int correct_count = 0;
    int incorrect_count = 0;

    double minutes() const;
    std::optional<double> accuracy() const;
};
