#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include "Types.hpp"
#include "models/ServerConfig.hpp"

class ILogger;

// 每个服务器一个工作线程，定时器只负责把任务投递过来
// 已有任务在排队时，新的任务被合并
class ServerWorker {
public:
    using PullFunction = std::function<PullReport(const ServerConfig&)>;

private:
    ServerConfig config;
    PullFunction runPull;
    ILogger* logger;

    std::thread workerThread;
    std::atomic<bool> running;
    std::atomic<bool> busy;
    bool pending;
    ScheduleType pendingType;
    size_t completedRuns;
    PullReport lastReport;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::condition_variable idleCv;

    void workerThreadFunc();

public:
    ServerWorker(const ServerConfig& serverConfig, PullFunction pullFunction, ILogger* log);
    ~ServerWorker();

    ServerWorker(const ServerWorker&) = delete;
    ServerWorker& operator=(const ServerWorker&) = delete;

    bool start();
    void stop();

    // 投递一次拉取；已有任务在排队时返回false
    bool enqueue(ScheduleType type);

    // 等待当前和排队的任务都完成（测试和关闭时使用）
    bool waitIdle(std::chrono::milliseconds timeout);

    bool isRunning() const;
    bool isBusy() const;
    size_t getCompletedRuns() const;
    PullReport getLastReport() const;
    const ServerConfig& getConfig() const;
};
