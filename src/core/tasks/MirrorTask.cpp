#include "MirrorTask.hpp"
#include "../Alerts.hpp"
#include "../Errors.hpp"
#include "../ProgressReporter.hpp"
#include "../models/ServerConfig.hpp"
#include "../../utils/FileSystem.hpp"
#include "../../utils/ILogger.hpp"
#include <algorithm>
#include <iterator>

MirrorTask::MirrorTask(const std::string& primary, const std::vector<std::string>& secondaries,
                       Alerts* alertSink, const ServerConfig* serverConfig,
                       const std::atomic<bool>* interruptFlag)
    : primaryPath(primary), secondaryPaths(secondaries), alerts(alertSink), config(serverConfig),
      interrupted(interruptFlag), status(TaskStatus::PENDING) {}

std::vector<std::string> MirrorTask::missingFiles(const std::set<std::string>& primaryNames,
                                                  const std::set<std::string>& secondaryNames) {
    std::vector<std::string> missing;
    std::set_difference(primaryNames.begin(), primaryNames.end(),
                        secondaryNames.begin(), secondaryNames.end(),
                        std::back_inserter(missing));
    return missing;
}

MirrorReport MirrorTask::execute() {
    ILogger* logger = alerts->getLogger();
    MirrorReport report;
    status = TaskStatus::RUNNING;
    
    std::set<std::string> primaryNames = FileSystem::listFileNames(primaryPath);
    try {
        for (const auto& secondary : secondaryPaths) {
            syncRoot(primaryNames, secondary, report);
        }
    } catch (const InterruptedError&) {
        status = TaskStatus::FAILED;
        throw;
    }
    
    status = (report.batch.hasFailures() || !report.unavailableRoots.empty())
                 ? TaskStatus::FAILED : TaskStatus::COMPLETED;
    logger->info("Mirror sync finished: " + std::to_string(report.batch.transferred()) + " copied, " +
                 std::to_string(report.batch.failed()) + " failed");
    return report;
}

void MirrorTask::syncRoot(const std::set<std::string>& primaryNames, const std::string& secondaryPath,
                          MirrorReport& report) {
    ILogger* logger = alerts->getLogger();
    
    if (!FileSystem::createDirectories(secondaryPath)) {
        report.unavailableRoots.push_back(secondaryPath);
        alerts->failure("Backup Error", "Cannot create secondary backup directory " + secondaryPath, config);
        return;
    }
    
    std::vector<std::string> toCopy = missingFiles(primaryNames, FileSystem::listFileNames(secondaryPath));
    logger->info("Files to copy to " + secondaryPath + ": " + std::to_string(toCopy.size()));
    
    for (const auto& name : toCopy) {
        if (interrupted && interrupted->load()) {
            throw InterruptedError("Mirror sync to " + secondaryPath + " interrupted");
        }
        
        std::string source = (fs::path(primaryPath) / name).string();
        std::string destination = (fs::path(secondaryPath) / name).string();
        ProgressReporter progress(logger, "Copying " + name + " to " + secondaryPath,
                                  FileSystem::getFileSize(source));
        
        std::string error;
        bool copied = FileSystem::copyFileChunked(source, destination, error,
            [&progress](uint64_t done, uint64_t) { progress.update(done); }, interrupted);
        
        FileTransferResult result;
        result.fileName = name;
        if (copied) {
            result.status = FileResultStatus::COPIED;
            result.bytes = FileSystem::getFileSize(destination);
            logger->info("Copied " + name + " to " + secondaryPath);
        } else {
            result.status = FileResultStatus::FAILED;
            result.error = error;
            alerts->failure("Backup Error", "Failed to copy " + name + " to " + secondaryPath + ": " + error, config);
        }
        report.batch.files.push_back(result);
    }
}

TaskStatus MirrorTask::getStatus() const {
    return status;
}
