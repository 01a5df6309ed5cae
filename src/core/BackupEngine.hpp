#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include "Types.hpp"
#include "tasks/PullTask.hpp"

class Alerts;
class TransferLock;
struct ServerConfig;

// 三类传输的入口；都通过同一个TransferLock互斥
class BackupEngine {
public:
    static PullReport pull(const ServerConfig& config, const TransportFactory& factory, TransferLock& lock,
                           Alerts* alerts, const PullSettings& settings = PullSettings(),
                           const std::atomic<bool>* interrupted = nullptr);

    // 单独执行镜像同步，会先获取TransferLock
    static MirrorReport mirror(const std::string& primaryPath, const std::vector<std::string>& secondaryPaths,
                               TransferLock& lock, Alerts* alerts, const ServerConfig* config = nullptr,
                               const std::atomic<bool>* interrupted = nullptr);

    static CopyReport copyToVolume(const std::string& sourceDir, const std::string& targetFolder,
                                   TransferLock& lock, Alerts* alerts,
                                   std::chrono::milliseconds lockTimeout = std::chrono::milliseconds::zero(),
                                   const std::atomic<bool>* interrupted = nullptr,
                                   const ServerConfig* config = nullptr);
};
