#include "orthoproj/logger.hpp"

#include <iostream>
#include <mutex>

namespace orthoproj {

LogLevel Logger::min_level_ = LogLevel::Info;

namespace {

const char* levelLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

std::mutex& sinkMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    min_level_ = level;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }
    std::ostream& out = level == LogLevel::Error ? std::cerr : std::cout;
    out << "[" << levelLabel(level) << "] " << message << std::endl;
}

} // namespace orthoproj
