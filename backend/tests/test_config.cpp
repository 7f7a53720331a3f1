#include "test_suite.hpp"

#include "../src/config/Config.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace {

template <typename E>
bool throwsOn(const std::string& json) {
  try {
    Config::parse(json);
  }
  catch (const E&) {
    return true;
  }
  catch (const std::exception& e) {
    std::cerr << "unexpected exception: " << e.what() << std::endl;
    return false;
  }
  return false;
}

} // namespace

int main() {
  TestSuite suite;

  {
    EngineConfig cfg = Config::parse("{}");
    suite.require(near(cfg.min_interval_hours, 24.0), "default min interval");
    suite.require(near(cfg.upcoming_window_hours, 12.0), "default upcoming window");
    suite.require(cfg.learned_streak_threshold == 3, "default learned threshold");
    suite.require(cfg.queue_limit == 20, "default queue limit");
    suite.require(near(cfg.quality_policy.perfect_threshold, 0.9), "default perfect threshold");
  }

  {
    EngineConfig cfg = Config::parse(R"({
      "min_interval_hours": 48,
      "upcoming_window_hours": 6.5,
      "learned_streak_threshold": 4,
      "queue_limit": 15,
      "utc_offset_minutes": -300,
      "weak_item_limit": 5,
      "log_level": "warn",
      "data_dir": "/tmp/unilex",
      "quality_policy": { "perfect_threshold": 0.85, "pass_threshold": 0.55 }
    })");
    suite.require(near(cfg.min_interval_hours, 48.0), "min interval read");
    suite.require(near(cfg.upcoming_window_hours, 6.5), "window read");
    suite.require(cfg.learned_streak_threshold == 4, "threshold read");
    suite.require(cfg.queue_limit == 15, "queue limit read");
    suite.require(cfg.utc_offset_minutes == -300, "utc offset read");
    suite.require(cfg.weak_item_limit == 5, "weak item limit read");
    suite.require(cfg.log_level == "warn", "log level read");
    suite.require(cfg.data_dir == "/tmp/unilex", "data dir read");
    suite.require(near(cfg.quality_policy.perfect_threshold, 0.85), "policy override read");
    suite.require(near(cfg.quality_policy.good_threshold, 0.7), "unspecified policy keys keep defaults");
    suite.require(near(cfg.quality_policy.pass_threshold, 0.55), "pass threshold read");
  }

  suite.require(throwsOn<ConfigError>("{ not json"), "malformed JSON is a ConfigError");
  suite.require(throwsOn<ConfigError>("[1, 2]"), "non-object root is a ConfigError");
  suite.require(throwsOn<ConfigError>(R"({"queue_limit": "many"})"), "wrong type is a ConfigError");
  suite.require(throwsOn<ConfigError>(R"({"quality_policy": 3})"), "policy must be an object");
  suite.require(throwsOn<std::invalid_argument>(R"({"queue_limit": 0})"), "zero queue limit rejected");
  suite.require(throwsOn<std::invalid_argument>(R"({"learned_streak_threshold": 0})"), "zero threshold rejected");
  suite.require(throwsOn<std::invalid_argument>(R"({"utc_offset_minutes": 2000})"), "offset out of range rejected");
  suite.require(throwsOn<std::invalid_argument>(R"({"quality_policy": {"poor_threshold": 0.8}})"),
                "non-descending policy rejected");
  suite.require(throwsOn<std::invalid_argument>(R"({"quality_policy": {"perfect_threshold": 0.95}})"),
                "perfect threshold above 0.9 rejected");
  suite.require(throwsOn<std::invalid_argument>(R"({"quality_policy": {"correct_grade": 3}})"),
                "correct grade below 4 rejected");
  suite.require(throwsOn<ConfigError>(R"({"queue_limit": -1})"), "negative queue limit is a ConfigError");
  suite.require(throwsOn<ConfigError>(R"({"weak_item_limit": -5})"), "negative weak item limit is a ConfigError");

  {
    EngineConfig cfg = Config::load("definitely-missing-unilex-config.json");
    suite.require(cfg.queue_limit == 20, "missing file gives defaults");
  }

  {
    const std::string path = "unilex_test_config.json";
    {
      std::ofstream out(path);
      out << R"({"queue_limit": 7})";
    }
    EngineConfig cfg = Config::load(path);
    suite.require(cfg.queue_limit == 7, "load reads the file");
    std::remove(path.c_str());
  }

  return finish(suite, "Config");
}
