// src/utils/ConsoleLogger.cpp
#include "ConsoleLogger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

static std::string getCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm localTime{};
    localtime_r(&time_t, &localTime);
    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR_LEVEL;
    return LogLevel::INFO;
}

ConsoleLogger::ConsoleLogger(LogLevel level) : minLevel(level) {
}

std::string ConsoleLogger::formatLine(LogLevel level, const std::string& message) {
    return "[" + getCurrentTime() + "] [" + toString(level) + "] " + message;
}

void ConsoleLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void ConsoleLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void ConsoleLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void ConsoleLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void ConsoleLogger::setLogLevel(LogLevel level) {
    minLevel = level;
}

LogLevel ConsoleLogger::getLogLevel() const {
    return minLevel;
}

void ConsoleLogger::log(LogLevel level, const std::string& message) {
    if (level < minLevel.load()) {
        return;
    }
    std::string line = formatLine(level, message);
    
    // 多个工作线程同时写日志，需要串行化输出
    std::lock_guard<std::mutex> lock(outputMutex);
    if (level == LogLevel::ERROR_LEVEL) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}
