#include "Coordinator.hpp"
#include "Alerts.hpp"
#include "BackupEngine.hpp"
#include "../utils/ILogger.hpp"
#include "../utils/Notifier.hpp"
#include "../utils/Sleep.hpp"
#include <exception>
#include <utility>

Coordinator::Coordinator(const std::vector<ServerConfig>& serverConfigs, TransportFactory factory,
                         VolumeEnumerator& enumerator, Alerts* alertSink, IUserPrompt* userPrompt,
                         const CoordinatorSettings& coordinatorSettings, const std::atomic<bool>* interruptFlag)
    : servers(serverConfigs), transportFactory(std::move(factory)), volumeEnumerator(enumerator),
      alerts(alertSink), prompt(userPrompt), settings(coordinatorSettings), interrupted(interruptFlag),
      scheduler(alertSink->getLogger()),
      ejector(enumerator, volumeState, transferLock, alertSink, userPrompt, true),
      started(false) {
}

Coordinator::~Coordinator() {
    shutdown();
}

bool Coordinator::start(std::chrono::system_clock::time_point now) {
    ILogger* logger = alerts->getLogger();
    if (started) {
        logger->error("Coordinator is already running.");
        return false;
    }
    if (servers.empty()) {
        logger->error("No valid server configurations found.");
        return false;
    }
    
    for (size_t i = 0; i < servers.size(); ++i) {
        const ServerConfig& config = servers[i];
        scheduler.scheduleServer(i, config, now);
        
        auto worker = std::make_unique<ServerWorker>(config, [this](const ServerConfig& c) {
            return BackupEngine::pull(c, transportFactory, transferLock, alerts, settings.pull, interrupted);
        }, logger);
        worker->start();
        workers.push_back(std::move(worker));
        
        watchers.push_back(std::make_unique<RemovableMediaWatcher>(config, volumeEnumerator, volumeState,
                                                                   requestQueue, logger, settings.pollInterval,
                                                                   settings.forgetVolumeOnDetach));
    }
    
    if (settings.watchVolumes) {
        for (auto& watcher : watchers) {
            watcher->start();
        }
    }
    
    if (settings.runOnStartup) {
        for (auto& worker : workers) {
            worker->enqueue(ScheduleType::STARTUP);
        }
    }
    
    started = true;
    logger->info("Backup coordinator started for " + std::to_string(servers.size()) + " server(s)");
    return true;
}

void Coordinator::tick(std::chrono::system_clock::time_point now) {
    for (size_t index : scheduler.collectDue(now)) {
        if (index < workers.size()) {
            workers[index]->enqueue(ScheduleType::SCHEDULED);
        }
    }
    processTransferRequests();
}

size_t Coordinator::processTransferRequests() {
    size_t performed = 0;
    TransferRequest request;
    while (!isInterrupted() && requestQueue.tryPop(request)) {
        if (handleTransferRequest(request)) {
            performed++;
        }
    }
    return performed;
}

bool Coordinator::handleTransferRequest(const TransferRequest& request) {
    ILogger* logger = alerts->getLogger();
    const RemovableVolume& volume = request.volume;
    
    RemovableVolume attached;
    if (!volumeState.findAttached(volume.id, attached)) {
        logger->info("Removable volume " + volume.id + " is no longer attached, dropping transfer request.");
        return false;
    }
    if (!prompt) {
        logger->warn("No interactive prompt available, skipping transfer to " + volume.mountPoint);
        return false;
    }
    
    if (!prompt->confirm("USB drive detected at " + attached.mountPoint +
                         ". Do you want to transfer the backup to this drive?")) {
        logger->info("User declined backup to " + attached.mountPoint);
        return false;
    }
    
    std::string folder = prompt->chooseOrCreateFolder(attached.mountPoint);
    CopyReport report = BackupEngine::copyToVolume(request.config.primaryBackupPath, folder, transferLock, alerts,
                                                   settings.lockWaitTimeout, interrupted, &request.config);
    if (!report.performed || report.interrupted) {
        return false;
    }
    
    std::string summary = std::to_string(report.batch.transferred()) + " file(s) copied to " + folder;
    if (report.batch.hasFailures()) {
        alerts->failure("USB Backup Error", summary + ", " + std::to_string(report.batch.failed()) + " failed.",
                        &request.config);
    } else {
        alerts->success("USB Backup Completed", summary + ".", &request.config);
    }
    
    EjectResult result = ejector.safeEject(attached);
    logger->info("Eject of " + attached.id + ": " + toString(result));
    return true;
}

size_t Coordinator::pollVolumes() {
    size_t enqueued = 0;
    for (auto& watcher : watchers) {
        enqueued += watcher->pollOnce();
    }
    return enqueued;
}

int Coordinator::run() {
    ILogger* logger = alerts->getLogger();
    try {
        if (!started && !start()) {
            return 1;
        }
        while (!isInterrupted()) {
            tick();
            if (!sleepUnlessInterrupted(settings.tickInterval, interrupted)) {
                break;
            }
        }
        logger->info("Interrupt received, shutting down.");
        shutdown();
        return 0;
    } catch (const std::exception& e) {
        logger->error(std::string("Unrecoverable error in backup coordinator: ") + e.what());
        shutdown();
        return 2;
    }
}

void Coordinator::shutdown() {
    for (auto& watcher : watchers) {
        watcher->stop();
    }
    for (auto& worker : workers) {
        worker->stop();
    }
    if (started) {
        alerts->getLogger()->info("Backup coordinator stopped.");
    }
    started = false;
}

bool Coordinator::waitForWorkers(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (auto& worker : workers) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0 || !worker->waitIdle(remaining)) {
            return false;
        }
    }
    return true;
}

bool Coordinator::isInterrupted() const {
    return interrupted && interrupted->load();
}

TransferLock& Coordinator::getTransferLock() {
    return transferLock;
}

RemovableVolumeState& Coordinator::getVolumeState() {
    return volumeState;
}

TransferRequestQueue& Coordinator::getRequestQueue() {
    return requestQueue;
}

const BackupScheduler& Coordinator::getScheduler() const {
    return scheduler;
}

const std::vector<std::unique_ptr<ServerWorker>>& Coordinator::getWorkers() const {
    return workers;
}
