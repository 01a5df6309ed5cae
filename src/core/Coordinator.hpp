#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <vector>
#include "BackupScheduler.hpp"
#include "RemovableMediaWatcher.hpp"
#include "ServerWorker.hpp"
#include "TransferLock.hpp"
#include "VolumeEjector.hpp"
#include "tasks/PullTask.hpp"

class Alerts;
class IUserPrompt;
class VolumeEnumerator;

struct CoordinatorSettings {
    std::chrono::milliseconds tickInterval{1000};
    std::chrono::milliseconds pollInterval{10000};
    std::chrono::milliseconds lockWaitTimeout{0};   // U盘拷贝等待传输结束的上限，0表示一直等待
    bool forgetVolumeOnDetach = false;
    bool runOnStartup = true;
    bool watchVolumes = true;                       // 是否启动监视线程
    PullSettings pull;
};

// 主循环：把到期的计划任务投递给各服务器的工作线程，并在控制线程上处理U盘请求
class Coordinator {
private:
    std::vector<ServerConfig> servers;
    TransportFactory transportFactory;
    VolumeEnumerator& volumeEnumerator;
    Alerts* alerts;
    IUserPrompt* prompt;
    CoordinatorSettings settings;
    const std::atomic<bool>* interrupted;

    TransferLock transferLock;
    RemovableVolumeState volumeState;
    TransferRequestQueue requestQueue;
    BackupScheduler scheduler;
    VolumeEjector ejector;
    std::vector<std::unique_ptr<ServerWorker>> workers;
    std::vector<std::unique_ptr<RemovableMediaWatcher>> watchers;
    bool started;

    bool isInterrupted() const;

public:
    Coordinator(const std::vector<ServerConfig>& serverConfigs, TransportFactory factory,
                VolumeEnumerator& enumerator, Alerts* alertSink, IUserPrompt* userPrompt,
                const CoordinatorSettings& coordinatorSettings = CoordinatorSettings(),
                const std::atomic<bool>* interruptFlag = nullptr);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // 登记计划、启动工作线程和监视线程；没有服务器时返回false
    bool start(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // 一次循环：投递到期任务，处理U盘请求
    void tick(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // 依次处理队列中的所有请求，返回真正执行了拷贝的数量
    size_t processTransferRequests();
    bool handleTransferRequest(const TransferRequest& request);

    // 所有监视器各枚举一次（不启动监视线程时使用）
    size_t pollVolumes();

    // 运行到被中断为止，返回进程退出码
    int run();

    // 停止并等待所有线程
    void shutdown();

    bool waitForWorkers(std::chrono::milliseconds timeout);

    TransferLock& getTransferLock();
    RemovableVolumeState& getVolumeState();
    TransferRequestQueue& getRequestQueue();
    const BackupScheduler& getScheduler() const;
    const std::vector<std::unique_ptr<ServerWorker>>& getWorkers() const;
};
