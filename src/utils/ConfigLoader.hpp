#pragma once
#include <string>
#include <vector>
#include "ILogger.hpp"
#include "SendmailMailer.hpp"
#include "../core/models/ServerConfig.hpp"

constexpr const char* DEFAULT_CONFIG_PATH = "/etc/backupsync.yaml";
constexpr const char* DEFAULT_BACKUP_TIMES = "03:00,15:00";

// 整个程序的配置
struct AppConfig {
    std::string logFile = "backup.log";
    LogLevel logLevel = LogLevel::INFO;
    int tickIntervalMs = 1000;
    int pollIntervalSeconds = 10;
    int lockWaitTimeoutSeconds = 0;        // 0 表示一直等待
    bool forgetVolumeOnDetach = false;
    bool runOnStartup = true;
    int throttleMs = 100;
    int connectAttempts = 3;
    int connectRetryDelaySeconds = 5;
    bool notifications = true;
    MailSettings mail;
    std::vector<ServerConfig> servers;     // 只包含通过校验的服务器
    size_t rejectedServers = 0;
};

// 读取YAML配置；文件无法读取或格式错误抛出ConfigError
// 缺少必填字段的服务器记录警告后被排除
class ConfigLoader {
public:
    static AppConfig loadFile(const std::string& path, ILogger* logger);
    static AppConfig loadString(const std::string& text, ILogger* logger);
};
