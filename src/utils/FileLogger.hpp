#pragma once
#include "ILogger.hpp"
#include "ConsoleLogger.hpp"
#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

// 文件日志：追加写入日志文件，同时回显到控制台
class FileLogger : public ILogger {
private:
    std::string filePath;
    std::ofstream logFile;
    std::mutex fileMutex;
    std::atomic<LogLevel> minLevel;
    ConsoleLogger console;
    bool echoToConsole;

public:
    FileLogger(const std::string& path, LogLevel level = LogLevel::INFO, bool echo = true);

    // 日志文件是否成功打开
    bool isOpen() const;

    const std::string& getFilePath() const;

    void info(const std::string& message) override;
    void error(const std::string& message) override;
    void warn(const std::string& message) override;
    void debug(const std::string& message) override;
    void setLogLevel(LogLevel level) override;
    LogLevel getLogLevel() const override;
    void log(LogLevel level, const std::string& message) override;
};
