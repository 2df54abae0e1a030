#include <algorithm>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "relay_log.h"

#define LOG_FILE_MAX_SIZE  (500u * 1024u * 1024u)
#define LOG_FILE_MAX_FILES 10

void initLogging(const RelayConfig &cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!cfg.logFile.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.logFile, LOG_FILE_MAX_SIZE, LOG_FILE_MAX_FILES);
            fileSink->set_level(spdlog::level::debug);
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex &e) {
            spdlog::error("cannot open log file {}: {}", cfg.logFile, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(
        RELAY_LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e | %^%l%$ | %v");

    spdlog::level::level_enum level = spdlog::level::from_str(cfg.logLevel);
    if (level == spdlog::level::off && cfg.logLevel != "off") {
        spdlog::warn("RELAY_LOG_LEVEL={} is not a log level - using info", cfg.logLevel);
        level = spdlog::level::info;
    }
    /* the file sink filters itself; let everything through to it */
    logger->set_level(cfg.logFile.empty() ? level
                                           : std::min(level, spdlog::level::debug));
    sinks.front()->set_level(level);

    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}
