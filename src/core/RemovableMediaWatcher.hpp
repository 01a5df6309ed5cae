#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <vector>
#include <thread>
#include "models/ServerConfig.hpp"
#include "models/Volume.hpp"

class ILogger;
class VolumeEnumerator;

// 所有监视线程共享：已提示过的卷、当前挂载的卷
// 忘记提示记录(forget)与弹出(clearAttached)是两个独立操作，由调用方决定策略
class RemovableVolumeState {
private:
    mutable std::mutex mutex;
    std::set<std::string> prompted;
    std::vector<RemovableVolume> attached;

public:
    // 首次标记返回true
    bool markPrompted(const std::string& volumeId);
    bool isPrompted(const std::string& volumeId) const;
    void forget(const std::string& volumeId);
    void forgetAll();

    void setAttached(const RemovableVolume& volume);
    void clearAttached(const std::string& volumeId);
    // 最早挂载且仍在的卷，没有返回false
    bool currentVolume(RemovableVolume& out) const;
    bool findAttached(const std::string& volumeId, RemovableVolume& out) const;
};

// 监视线程 -> 主循环的拷贝请求队列（FIFO，无界，单消费者）
class TransferRequestQueue {
private:
    mutable std::mutex mutex;
    std::queue<TransferRequest> requests;

public:
    void push(const TransferRequest& request);
    bool tryPop(TransferRequest& out);
    size_t size() const;
    bool empty() const;
};

// 每个服务器一个监视器，定期枚举可移动卷，新卷入队等待用户确认
class RemovableMediaWatcher {
private:
    ServerConfig config;
    VolumeEnumerator& enumerator;
    RemovableVolumeState& state;
    TransferRequestQueue& queue;
    ILogger* logger;
    std::chrono::milliseconds pollInterval;
    bool forgetOnDetach;

    // 本监视器上一次看到的卷
    std::set<std::string> previousIds;

    std::thread watchThread;
    std::atomic<bool> running;
    std::mutex waitMutex;
    std::condition_variable waitCv;

    void watchThreadFunc();

public:
    RemovableMediaWatcher(const ServerConfig& serverConfig, VolumeEnumerator& volumeEnumerator,
                          RemovableVolumeState& sharedState, TransferRequestQueue& requestQueue, ILogger* log,
                          std::chrono::milliseconds interval = std::chrono::seconds(10),
                          bool forgetVolumeOnDetach = false);
    ~RemovableMediaWatcher();

    RemovableMediaWatcher(const RemovableMediaWatcher&) = delete;
    RemovableMediaWatcher& operator=(const RemovableMediaWatcher&) = delete;

    // 执行一次枚举，返回新入队的请求数
    size_t pollOnce();

    bool start();
    void stop();
    bool isRunning() const;
};
