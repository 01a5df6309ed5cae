#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "../Types.hpp"
#include "../models/RemoteFileEntry.hpp"
#include "../models/ServerConfig.hpp"
#include "../../utils/TransportClient.hpp"

class Alerts;
class TransferLock;

// 暂存目录名（位于主备份目录下）
constexpr const char* STAGING_DIR_NAME = "temp";

struct PullSettings {
    int connectAttempts = 3;
    std::chrono::milliseconds retryDelay{5000};
    std::chrono::milliseconds throttle{100};        // 每个文件下载后的固定停顿
    std::chrono::milliseconds lockTimeout{0};       // 0 表示一直等待
};

// 从一个远程服务器拉取新文件到主备份目录，然后同步到二级目录
class PullTask {
private:
    ServerConfig config;
    TransportFactory transportFactory;
    TransferLock& transferLock;
    Alerts* alerts;
    PullSettings settings;
    const std::atomic<bool>* interrupted;
    TaskStatus status;

    // 建立会话，认证失败不重试，其它错误按固定间隔重试
    std::unique_ptr<TransportClient> openSession();

    // 下载一个文件：暂存目录 -> 原子重命名到主目录 -> 设置修改时间
    FileTransferResult downloadFile(TransportClient& client, const RemoteFileEntry& entry,
                                    const std::string& stagingDir);

    void createBackupDirectories();
    void cleanupStaging(const std::string& stagingDir);
    PullOutcome summarize(PullReport& report);
    bool isInterrupted() const;

public:
    PullTask(const ServerConfig& serverConfig, TransportFactory factory, TransferLock& lock,
             Alerts* alertSink, const PullSettings& pullSettings = PullSettings(),
             const std::atomic<bool>* interruptFlag = nullptr);

    PullReport execute();
    TaskStatus getStatus() const;

    // 远程条目中清理后的文件名不在本地集合里的部分，保持远程顺序，同名只保留第一个
    static std::vector<RemoteFileEntry> selectNewFiles(const std::vector<RemoteFileEntry>& remote,
                                                       const std::set<std::string>& localNames);

    static std::string stagingDirectory(const std::string& primaryBackupPath);

    // 远程路径拼接，固定使用 '/'
    static std::string remotePath(const std::string& directory, const std::string& fileName);
};
