#pragma once
#include <cstdint>
#include <string>
#include <vector>

// 每日备份时间（24小时制）
struct BackupTime {
    int hour = 0;
    int minute = 0;

    // 解析 "HH:MM"，格式错误返回false
    static bool parse(const std::string& text, BackupTime& out);
    std::string toString() const;

    bool operator==(const BackupTime& other) const {
        return hour == other.hour && minute == other.minute;
    }
};

// 单个远程服务器的配置，加载后不可变
struct ServerConfig {
    std::string name;
    std::string address;
    uint16_t port = 22;
    std::string username;
    std::string password;
    std::string sourcePath;
    std::string primaryBackupPath;
    std::vector<std::string> secondaryBackupPaths;
    std::vector<BackupTime> backupTimes;
    std::string hostKeyFingerprint;   // 为空表示接受任意主机密钥
    bool sendMail = false;
    bool notifyDesktop = true;

    // 缺失的必填字段名（address/username/password/source_path/primary_backup_path）
    std::vector<std::string> missingFields() const;
    bool isValid() const;

    // 日志里使用的名字：优先name，否则address
    std::string displayName() const;
};

// 拆分逗号分隔的列表，去掉首尾空白与空项
std::vector<std::string> splitCommaList(const std::string& text);
