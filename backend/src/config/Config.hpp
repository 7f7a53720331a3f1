#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include "../core/OutcomeClassifier.hpp"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct EngineConfig {
    double min_interval_hours = 24.0;
    double upcoming_window_hours = 12.0;
    int learned_streak_threshold = 3;
    std::size_t queue_limit = 20;
    int utc_offset_minutes = 0;
    std::size_t weak_item_limit = 10;
    QualityPolicy quality_policy;

    std::string log_file = "unilex.log";
    std::string log_level = "info";
    std::string data_dir = ".";

    void validate() const;
};

namespace Config
{
    // Missing file -> defaults. Malformed JSON or wrong types -> ConfigError.
    EngineConfig load(const std::string& path);
    EngineConfig parse(const std::string& jsonText);
}
