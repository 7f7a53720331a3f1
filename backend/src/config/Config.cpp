#include "Config.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace
{
    template <typename T>
    void readField(const nlohmann::json& j, const char* key, T& out) {
        if (!j.contains(key) || j.at(key).is_null()) return;
        try {
            out = j.at(key).get<T>();
        }
        catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
        }
    }

    // nlohmann wraps negative numbers into huge unsigned values; read signed first
    void readField(const nlohmann::json& j, const char* key, std::size_t& out) {
        long long value = 0;
        readField(j, key, value);
        if (!j.contains(key) || j.at(key).is_null()) return;
        if (value < 0) {
            throw ConfigError(std::string("invalid value for '") + key + "': must not be negative");
        }
        out = static_cast<std::size_t>(value);
    }
}

void EngineConfig::validate() const {
    if (!(min_interval_hours > 0.0)) {
        throw std::invalid_argument("min_interval_hours must be positive");
    }
    if (upcoming_window_hours < 0.0) {
        throw std::invalid_argument("upcoming_window_hours must not be negative");
    }
    if (learned_streak_threshold < 1) {
        throw std::invalid_argument("learned_streak_threshold must be at least 1");
    }
    if (queue_limit == 0) {
        throw std::invalid_argument("queue_limit must be greater than 0");
    }
    if (utc_offset_minutes < -14 * 60 || utc_offset_minutes > 14 * 60) {
        throw std::invalid_argument("utc_offset_minutes must be within [-840, 840]");
    }
    quality_policy.validate();
}

namespace Config
{
    EngineConfig parse(const std::string& jsonText) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(jsonText);
        }
        catch (const nlohmann::json::parse_error& e) {
            throw ConfigError(std::string("config is not valid JSON: ") + e.what());
        }
        if (!j.is_object()) {
            throw ConfigError("config root must be a JSON object");
        }

        EngineConfig cfg;
        readField(j, "min_interval_hours", cfg.min_interval_hours);
        readField(j, "upcoming_window_hours", cfg.upcoming_window_hours);
        readField(j, "learned_streak_threshold", cfg.learned_streak_threshold);
        readField(j, "queue_limit", cfg.queue_limit);
        readField(j, "utc_offset_minutes", cfg.utc_offset_minutes);
        readField(j, "weak_item_limit", cfg.weak_item_limit);
        readField(j, "log_file", cfg.log_file);
        readField(j, "log_level", cfg.log_level);
        readField(j, "data_dir", cfg.data_dir);

        if (j.contains("quality_policy")) {
            const auto& qp = j.at("quality_policy");
            if (!qp.is_object()) {
                throw ConfigError("'quality_policy' must be an object");
            }
            readField(qp, "perfect_threshold", cfg.quality_policy.perfect_threshold);
            readField(qp, "good_threshold", cfg.quality_policy.good_threshold);
            readField(qp, "pass_threshold", cfg.quality_policy.pass_threshold);
            readField(qp, "poor_threshold", cfg.quality_policy.poor_threshold);
            readField(qp, "correct_grade", cfg.quality_policy.correct_grade);
            readField(qp, "incorrect_grade", cfg.quality_policy.incorrect_grade);
        }

        cfg.validate();
        return cfg;
    }

    EngineConfig load(const std::string& path) {
        if (!std::filesystem::exists(path)) {
            spdlog::warn("Config file '{}' not found; using defaults", path);
            EngineConfig cfg;
            cfg.validate();
            return cfg;
        }

        std::ifstream in(path);
        if (!in) {
            throw ConfigError("cannot open config file '" + path + "'");
        }
        std::ostringstream buf;
        buf << in.rdbuf();

        EngineConfig cfg = parse(buf.str());
        spdlog::info("Loaded config from '{}'", path);
        return cfg;
    }
}
