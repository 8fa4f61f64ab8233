#include "peerchunk/core/logger.hpp"
#include "peerchunk/core/utils.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>

namespace peerchunk::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::initialize(const std::string& log_file, LogLevel level, LogLevel file_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    
    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 1048576 * 5, 3);
        file_sink->set_level(static_cast<spdlog::level::level_enum>(file_level));
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(file_sink);
    }
    
    logger_ = std::make_shared<spdlog::logger>("peerchunk", sinks.begin(), sinks.end());
    auto logger_level = static_cast<spdlog::level::level_enum>(level);
    if (!log_file.empty()) {
        logger_level = std::min(logger_level, static_cast<spdlog::level::level_enum>(file_level));
    }
    logger_->set_level(logger_level);
    logger_->flush_on(spdlog::level::warn);
    
    spdlog::set_default_logger(logger_);
    
    LOG_INFO("Logger initialized with level: {}", static_cast<int>(level));
}

void Logger::shutdown() {
    if (logger_) {
        LOG_INFO("Shutting down logger");
        logger_->flush();
        spdlog::shutdown();
        logger_.reset();
    }
}

LogLevel Logger::level_from_verbosity(int verbosity) {
    switch (verbosity) {
        case 0: return LogLevel::Off;
        case 1: return LogLevel::Warn;
        case 2: return LogLevel::Info;
        default: return verbosity < 0 ? LogLevel::Off : LogLevel::Debug;
    }
}

LogLevel Logger::level_from_string(const std::string& name) {
    std::string lower = utils::StringUtils::to_lower(name);
    
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Warn;
}

}
