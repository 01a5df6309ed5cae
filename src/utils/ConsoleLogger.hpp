#pragma once
#include "ILogger.hpp"
#include <atomic>
#include <mutex>
#include <string>

// 控制台日志：INFO/WARN/DEBUG写stdout，ERROR写stderr
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(LogLevel level = LogLevel::INFO);

    void info(const std::string& message) override;

    void error(const std::string& message) override;

    void warn(const std::string& message) override;

    void debug(const std::string& message) override;

    void setLogLevel(LogLevel level) override;

    LogLevel getLogLevel() const override;

    void log(LogLevel level, const std::string& message) override;

    // 生成 "[时间] [级别] 消息" 格式的日志行
    static std::string formatLine(LogLevel level, const std::string& message);

private:
    std::atomic<LogLevel> minLevel;
    std::mutex outputMutex;
};
