#pragma once
#include <chrono>
#include <cstddef>
#include <vector>
#include "models/ServerConfig.hpp"

class ILogger;

struct ScheduledJob {
    size_t serverIndex;
    BackupTime time;
    std::chrono::system_clock::time_point nextRun;
};

// 每日定时任务：到点后返回对应的服务器，并把下一次运行推到下一天
class BackupScheduler {
private:
    ILogger* logger;
    std::vector<ScheduledJob> jobs;

public:
    explicit BackupScheduler(ILogger* log);

    void addDailyJob(size_t serverIndex, const BackupTime& time, std::chrono::system_clock::time_point now);

    // 为服务器的每个备份时间各登记一个任务
    void scheduleServer(size_t serverIndex, const ServerConfig& config, std::chrono::system_clock::time_point now);

    // 返回到期的服务器下标（按登记顺序，同一服务器只出现一次）
    std::vector<size_t> collectDue(std::chrono::system_clock::time_point now);

    const std::vector<ScheduledJob>& getJobs() const;

    // 本地时间time在now之后的下一次出现
    static std::chrono::system_clock::time_point nextOccurrence(const BackupTime& time,
                                                                std::chrono::system_clock::time_point now);
};
