#include "ServerWorker.hpp"
#include "../utils/ILogger.hpp"
#include <exception>
#include <utility>

ServerWorker::ServerWorker(const ServerConfig& serverConfig, PullFunction pullFunction, ILogger* log)
    : config(serverConfig), runPull(std::move(pullFunction)), logger(log), running(false), busy(false),
      pending(false), pendingType(ScheduleType::SCHEDULED), completedRuns(0) {
}

ServerWorker::~ServerWorker() {
    stop();
}

bool ServerWorker::start() {
    if (running) {
        logger->error("Worker for server " + config.displayName() + " is already running.");
        return false;
    }
    running = true;
    workerThread = std::thread(&ServerWorker::workerThreadFunc, this);
    logger->debug("Worker started for server " + config.displayName());
    return true;
}

void ServerWorker::stop() {
    if (!running) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        running = false;
        pending = false;
    }
    cv.notify_one();
    if (workerThread.joinable()) {
        workerThread.join();
    }
    idleCv.notify_all();
    logger->debug("Worker stopped for server " + config.displayName());
}

bool ServerWorker::enqueue(ScheduleType type) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running) {
            return false;
        }
        if (pending) {
            logger->info("Backup for server " + config.displayName() + " already queued, skipping " +
                         toString(type) + " run");
            return false;
        }
        pending = true;
        pendingType = type;
    }
    cv.notify_one();
    return true;
}

bool ServerWorker::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return idleCv.wait_for(lock, timeout, [this]() {
        return !pending && !busy;
    });
}

bool ServerWorker::isRunning() const {
    return running;
}

bool ServerWorker::isBusy() const {
    return busy;
}

size_t ServerWorker::getCompletedRuns() const {
    std::lock_guard<std::mutex> lock(mutex);
    return completedRuns;
}

PullReport ServerWorker::getLastReport() const {
    std::lock_guard<std::mutex> lock(mutex);
    return lastReport;
}

const ServerConfig& ServerWorker::getConfig() const {
    return config;
}

void ServerWorker::workerThreadFunc() {
    while (true) {
        ScheduleType type;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this]() {
                return pending || !running;
            });
            if (!running) {
                break;
            }
            pending = false;
            busy = true;
            type = pendingType;
        }
        
        logger->info("Running " + toString(type) + " backup for server " + config.displayName());
        PullReport report;
        try {
            report = runPull(config);
        } catch (const std::exception& e) {
            // 一个服务器的错误不能影响其它服务器
            report.outcome = PullOutcome::FAILED;
            report.message = e.what();
            logger->error("Exception during backup for server " + config.displayName() + ": " + e.what());
        }
        
        {
            std::lock_guard<std::mutex> lock(mutex);
            lastReport = report;
            completedRuns++;
            busy = false;
        }
        idleCv.notify_all();
    }
}
