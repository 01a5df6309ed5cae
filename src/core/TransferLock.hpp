#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// 进程级的"正在传输"标志：远程拉取、镜像同步、U盘拷贝三者互斥
class TransferLock {
private:
    mutable std::mutex mutex;
    mutable std::condition_variable idleCv;
    bool active;

    // 中断标志的检查间隔
    static constexpr std::chrono::milliseconds INTERRUPT_CHECK_INTERVAL{200};

public:
    TransferLock();

    TransferLock(const TransferLock&) = delete;
    TransferLock& operator=(const TransferLock&) = delete;

    // 当前空闲则置为活动并返回true，否则立即返回false
    bool tryBegin();

    // 等待空闲后置为活动。timeout为0表示不超时
    // 超时或被中断返回false
    bool acquire(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(),
                 const std::atomic<bool>* interrupted = nullptr);

    // 等待直到没有活动传输，不占用标志
    bool waitUntilIdle(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(),
                       const std::atomic<bool>* interrupted = nullptr) const;

    // 幂等，任何时候调用都安全
    void end();

    bool isActive() const;

private:
    template <typename Predicate>
    bool waitFor(std::unique_lock<std::mutex>& lock, Predicate ready,
                 std::chrono::milliseconds timeout, const std::atomic<bool>* interrupted) const;
};

// 作用域内持有TransferLock，析构时一定释放
class TransferGuard {
private:
    TransferLock& lock;
    bool owned;

public:
    // 阻塞获取；owns()为false表示超时或被中断
    explicit TransferGuard(TransferLock& transferLock,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(),
                           const std::atomic<bool>* interrupted = nullptr);
    ~TransferGuard();

    TransferGuard(const TransferGuard&) = delete;
    TransferGuard& operator=(const TransferGuard&) = delete;

    bool owns() const;

    // 提前释放
    void release();
};
