#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    // Returns false (default logger untouched) if the log file cannot be opened
    inline bool init(const std::string& logFile = "unilex.log", const std::string& level = "debug")
    {
        // File logger becomes the default; the CLI owns stdout
        std::shared_ptr<spdlog::logger> file_logger;
        try {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile);
            file_logger = std::make_shared<spdlog::logger>("file_logger", sink);
        }
        catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Cannot open log file '" << logFile << "': " << e.what() << "\n";
            return false;
        }
        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        auto lvl = spdlog::level::from_str(level);
        if (lvl == spdlog::level::off && level != "off") {
            lvl = spdlog::level::debug;
            spdlog::warn("Unknown log level '{}', using debug", level);
        }
        spdlog::set_level(lvl);
        spdlog::flush_on(spdlog::level::info);
        return true;
    }
}
