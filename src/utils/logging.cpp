#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace meetscribe {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

namespace {

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << millis.count();
    return ss.str();
}

} // namespace

void Logger::initialize(LogLevel level) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
        if (initialized_) {
            return;
        }
        initialized_ = true;
    }
    debug("Logger initialized at level " + levelToString(level));
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::info(const std::string& message) {
    write(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    write(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    write(LogLevel::ERROR, message);
}

void Logger::debug(const std::string& message) {
    write(LogLevel::DEBUG, message);
}

bool Logger::parseLevel(const std::string& text, LogLevel& level) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        level = LogLevel::INFO;
    } else if (upper == "WARN" || upper == "WARNING") {
        level = LogLevel::WARN;
    } else if (upper == "ERROR") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_)) {
        return;
    }

    std::ostream& out = (level == LogLevel::WARN || level == LogLevel::ERROR) ? std::cerr : std::cout;
    out << currentTimestamp() << " [" << levelToString(level) << "] " << message << std::endl;
}

} // namespace utils
} // namespace meetscribe
