// core/BackupEngine.cpp
#include "BackupEngine.hpp"
#include "Alerts.hpp"
#include "Errors.hpp"
#include "TransferLock.hpp"
#include "tasks/MirrorTask.hpp"
#include "tasks/VolumeCopyTask.hpp"
#include "../utils/ILogger.hpp"

PullReport BackupEngine::pull(const ServerConfig& config, const TransportFactory& factory, TransferLock& lock,
                              Alerts* alerts, const PullSettings& settings,
                              const std::atomic<bool>* interrupted) {
    PullTask task(config, factory, lock, alerts, settings, interrupted);
    return task.execute();
}

MirrorReport BackupEngine::mirror(const std::string& primaryPath, const std::vector<std::string>& secondaryPaths,
                                  TransferLock& lock, Alerts* alerts, const ServerConfig* config,
                                  const std::atomic<bool>* interrupted) {
    MirrorReport report;
    TransferGuard guard(lock, std::chrono::milliseconds::zero(), interrupted);
    if (!guard.owns()) {
        alerts->getLogger()->info("Mirror sync interrupted before it started.");
        return report;
    }
    
    MirrorTask task(primaryPath, secondaryPaths, alerts, config, interrupted);
    try {
        report = task.execute();
    } catch (const InterruptedError&) {
        alerts->info("Backup Interrupted", "Mirror sync interrupted by user.", config);
    }
    return report;
}

CopyReport BackupEngine::copyToVolume(const std::string& sourceDir, const std::string& targetFolder,
                                      TransferLock& lock, Alerts* alerts, std::chrono::milliseconds lockTimeout,
                                      const std::atomic<bool>* interrupted, const ServerConfig* config) {
    VolumeCopyTask task(sourceDir, targetFolder, lock, alerts, lockTimeout, interrupted, config);
    return task.execute();
}
