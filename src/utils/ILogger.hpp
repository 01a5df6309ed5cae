#pragma once
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL
};

inline std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        default: return "UNKNOWN";
    }
}

// 解析配置文件中的日志级别（debug/info/warn/error），无法识别时返回INFO
LogLevel parseLogLevel(const std::string& name);

class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void info(const std::string& message) = 0;

    virtual void error(const std::string& message) = 0;

    virtual void warn(const std::string& message) = 0;
    
    virtual void debug(const std::string& message) = 0;
    
    virtual void setLogLevel(LogLevel level) = 0;
    
    virtual LogLevel getLogLevel() const = 0;
    
    virtual void log(LogLevel level, const std::string& message) = 0;
};
