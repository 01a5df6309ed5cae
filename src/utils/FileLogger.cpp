// src/utils/FileLogger.cpp
#include "FileLogger.hpp"

FileLogger::FileLogger(const std::string& path, LogLevel level, bool echo)
    : filePath(path), logFile(path, std::ios::out | std::ios::app), minLevel(level),
      console(level), echoToConsole(echo) {
    if (!logFile.is_open()) {
        console.error("Failed to open log file: " + path + ", logging to console only");
    }
}

bool FileLogger::isOpen() const {
    return logFile.is_open();
}

const std::string& FileLogger::getFilePath() const {
    return filePath;
}

void FileLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void FileLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void FileLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void FileLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void FileLogger::setLogLevel(LogLevel level) {
    minLevel = level;
    console.setLogLevel(level);
}

LogLevel FileLogger::getLogLevel() const {
    return minLevel;
}

void FileLogger::log(LogLevel level, const std::string& message) {
    if (level < minLevel.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(fileMutex);
        if (logFile.is_open()) {
            logFile << ConsoleLogger::formatLine(level, message) << '\n';
            logFile.flush();
        }
    }
    if (echoToConsole || !logFile.is_open()) {
        console.log(level, message);
    }
}
