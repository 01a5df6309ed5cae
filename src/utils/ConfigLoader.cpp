#include "ConfigLoader.hpp"
#include "../core/Errors.hpp"
#include <yaml-cpp/yaml.h>

static std::string readString(const YAML::Node& node, const char* key, const std::string& fallback = "") {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    return value.as<std::string>();
}

static int readInt(const YAML::Node& node, const char* key, int fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    return value.as<int>();
}

static bool readBool(const YAML::Node& node, const char* key, bool fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    // 兼容 .env 风格的 "yes"/"no"
    std::string text = value.as<std::string>();
    if (text == "yes" || text == "Yes" || text == "YES") return true;
    if (text == "no" || text == "No" || text == "NO") return false;
    return value.as<bool>();
}

// 既接受YAML列表，也接受逗号分隔的字符串
static std::vector<std::string> readList(const YAML::Node& node, const char* key,
                                         const std::vector<std::string>& fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    if (value.IsSequence()) {
        std::vector<std::string> items;
        for (const auto& item : value) {
            std::string text = item.as<std::string>();
            if (!text.empty()) {
                items.push_back(text);
            }
        }
        return items;
    }
    return splitCommaList(value.as<std::string>());
}

static std::vector<BackupTime> parseBackupTimes(const std::vector<std::string>& texts, const std::string& server,
                                                ILogger* logger) {
    std::vector<BackupTime> times;
    for (const auto& text : texts) {
        BackupTime time;
        if (!BackupTime::parse(text, time)) {
            logger->error("Invalid backup time format '" + text + "' for server " + server);
            continue;
        }
        bool duplicate = false;
        for (const auto& t : times) {
            if (t == time) duplicate = true;
        }
        if (!duplicate) {
            times.push_back(time);
        }
    }
    return times;
}

static ServerConfig parseServer(const YAML::Node& node, const AppConfig& app,
                                const std::vector<std::string>& defaultTimes, ILogger* logger) {
    ServerConfig server;
    server.name = readString(node, "name");
    server.address = readString(node, "address");
    server.port = static_cast<uint16_t>(readInt(node, "port", 22));
    server.username = readString(node, "username");
    server.password = readString(node, "password");
    server.sourcePath = readString(node, "source_path");
    server.primaryBackupPath = readString(node, "primary_backup_path");
    server.secondaryBackupPaths = readList(node, "secondary_backup_paths", {});
    server.hostKeyFingerprint = readString(node, "host_key_fingerprint");
    server.sendMail = readBool(node, "send_mail", false);
    server.notifyDesktop = readBool(node, "notify", app.notifications);
    server.backupTimes = parseBackupTimes(readList(node, "backup_times", defaultTimes),
                                          server.displayName(), logger);
    return server;
}

static AppConfig parseConfig(const YAML::Node& root, ILogger* logger) {
    AppConfig config;
    if (!root || !root.IsMap()) {
        throw ConfigError("configuration root must be a mapping");
    }
    
    config.logFile = readString(root, "log_file", config.logFile);
    config.logLevel = parseLogLevel(readString(root, "log_level", "info"));
    config.tickIntervalMs = readInt(root, "tick_interval_ms", config.tickIntervalMs);
    config.pollIntervalSeconds = readInt(root, "poll_interval_seconds", config.pollIntervalSeconds);
    config.lockWaitTimeoutSeconds = readInt(root, "lock_wait_timeout_seconds", config.lockWaitTimeoutSeconds);
    config.forgetVolumeOnDetach = readBool(root, "forget_volume_on_detach", config.forgetVolumeOnDetach);
    config.runOnStartup = readBool(root, "run_on_startup", config.runOnStartup);
    config.throttleMs = readInt(root, "throttle_ms", config.throttleMs);
    config.connectAttempts = readInt(root, "connect_attempts", config.connectAttempts);
    config.connectRetryDelaySeconds = readInt(root, "connect_retry_delay_seconds", config.connectRetryDelaySeconds);
    config.notifications = readBool(root, "notifications", config.notifications);
    
    const YAML::Node mail = root["mail"];
    if (mail && mail.IsMap()) {
        config.mail.sender = readString(mail, "sender");
        config.mail.recipient = readString(mail, "recipient");
        config.mail.command = readString(mail, "command", config.mail.command);
    }
    
    std::vector<std::string> defaultTimes = readList(root, "backup_times", splitCommaList(DEFAULT_BACKUP_TIMES));
    
    const YAML::Node servers = root["servers"];
    if (servers && !servers.IsSequence()) {
        throw ConfigError("'servers' must be a list");
    }
    size_t index = 0;
    if (servers) {
        for (const auto& node : servers) {
            index++;
            ServerConfig server = parseServer(node, config, defaultTimes, logger);
            std::vector<std::string> missing = server.missingFields();
            if (!missing.empty()) {
                std::string fields;
                for (const auto& f : missing) {
                    fields += (fields.empty() ? "" : ", ") + f;
                }
                logger->warn("Configuration for server index " + std::to_string(index) +
                             " is missing or invalid (missing: " + fields + ")");
                config.rejectedServers++;
                continue;
            }
            config.servers.push_back(server);
            logger->info("Loaded configuration for server index: " + std::to_string(index));
        }
    }
    
    logger->info("Total servers loaded: " + std::to_string(config.servers.size()));
    return config;
}

AppConfig ConfigLoader::loadFile(const std::string& path, ILogger* logger) {
    try {
        return parseConfig(YAML::LoadFile(path), logger);
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot load configuration " + path + ": " + e.what());
    }
}

AppConfig ConfigLoader::loadString(const std::string& text, ILogger* logger) {
    try {
        return parseConfig(YAML::Load(text), logger);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("cannot parse configuration: ") + e.what());
    }
}
