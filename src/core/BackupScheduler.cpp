#include "BackupScheduler.hpp"
#include "../utils/ILogger.hpp"
#include <algorithm>
#include <ctime>

BackupScheduler::BackupScheduler(ILogger* log) : logger(log) {
}

std::chrono::system_clock::time_point BackupScheduler::nextOccurrence(const BackupTime& time,
                                                                      std::chrono::system_clock::time_point now) {
    std::time_t nowT = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&nowT, &local);
    local.tm_hour = time.hour;
    local.tm_min = time.minute;
    local.tm_sec = 0;
    local.tm_isdst = -1;
    
    std::time_t candidate = std::mktime(&local);
    auto result = std::chrono::system_clock::from_time_t(candidate);
    if (result <= now) {
        // mktime会规范化越界的日期
        local.tm_mday += 1;
        local.tm_hour = time.hour;
        local.tm_min = time.minute;
        local.tm_sec = 0;
        local.tm_isdst = -1;
        result = std::chrono::system_clock::from_time_t(std::mktime(&local));
    }
    return result;
}

void BackupScheduler::addDailyJob(size_t serverIndex, const BackupTime& time,
                                  std::chrono::system_clock::time_point now) {
    jobs.push_back(ScheduledJob{serverIndex, time, nextOccurrence(time, now)});
}

void BackupScheduler::scheduleServer(size_t serverIndex, const ServerConfig& config,
                                     std::chrono::system_clock::time_point now) {
    for (const auto& time : config.backupTimes) {
        addDailyJob(serverIndex, time, now);
        logger->info("Scheduled backup for server " + config.displayName() + " at " + time.toString());
    }
}

std::vector<size_t> BackupScheduler::collectDue(std::chrono::system_clock::time_point now) {
    std::vector<size_t> due;
    for (auto& job : jobs) {
        if (job.nextRun > now) {
            continue;
        }
        job.nextRun = nextOccurrence(job.time, now);
        if (std::find(due.begin(), due.end(), job.serverIndex) == due.end()) {
            due.push_back(job.serverIndex);
        }
    }
    return due;
}

const std::vector<ScheduledJob>& BackupScheduler::getJobs() const {
    return jobs;
}
