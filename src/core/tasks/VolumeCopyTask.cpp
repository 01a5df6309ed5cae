#include "VolumeCopyTask.hpp"
#include "../Alerts.hpp"
#include "../Errors.hpp"
#include "../ProgressReporter.hpp"
#include "../TransferLock.hpp"
#include "../../utils/FileSystem.hpp"
#include "../../utils/ILogger.hpp"

VolumeCopyTask::VolumeCopyTask(const std::string& source, const std::string& target, TransferLock& lock,
                               Alerts* alertSink, std::chrono::milliseconds timeout,
                               const std::atomic<bool>* interruptFlag, const ServerConfig* serverConfig)
    : sourceDir(source), targetFolder(target), transferLock(lock), alerts(alertSink), lockTimeout(timeout),
      interrupted(interruptFlag), config(serverConfig), status(TaskStatus::PENDING) {}

CopyReport VolumeCopyTask::execute() {
    ILogger* logger = alerts->getLogger();
    CopyReport report;
    report.targetFolder = targetFolder;
    status = TaskStatus::RUNNING;
    
    if (targetFolder.empty()) {
        logger->info("No folder selected or created for backup. Skipping backup to USB.");
        status = TaskStatus::COMPLETED;
        return report;
    }
    
    // 不与计划中的拉取重叠
    logger->info("Waiting for active transfers to finish before copying to " + targetFolder);
    TransferGuard guard(transferLock, lockTimeout, interrupted);
    if (!guard.owns()) {
        if (interrupted && interrupted->load()) {
            report.interrupted = true;
            alerts->info("Backup Interrupted", "Copy to " + targetFolder + " interrupted before it started.",
                         config);
        } else {
            alerts->warning("USB Backup", "Timed out waiting for the active transfer; copy to " +
                            targetFolder + " skipped.", config);
        }
        status = TaskStatus::FAILED;
        return report;
    }
    
    report.performed = true;
    try {
        copyAll(report);
    } catch (const InterruptedError&) {
        report.interrupted = true;
        alerts->info("Backup Interrupted", "Copy to " + targetFolder + " interrupted by user.", config);
    }
    
    status = (report.interrupted || report.batch.hasFailures()) ? TaskStatus::FAILED : TaskStatus::COMPLETED;
    logger->info("Copy to " + targetFolder + " finished: " + std::to_string(report.batch.transferred()) +
                 " copied, " + std::to_string(report.batch.skipped()) + " skipped, " +
                 std::to_string(report.batch.failed()) + " failed");
    return report;
}

void VolumeCopyTask::copyAll(CopyReport& report) {
    ILogger* logger = alerts->getLogger();
    
    for (const auto& name : FileSystem::listFileNames(sourceDir)) {
        if (interrupted && interrupted->load()) {
            throw InterruptedError("copy to " + targetFolder + " interrupted");
        }
        
        FileTransferResult result;
        result.fileName = name;
        std::string source = (fs::path(sourceDir) / name).string();
        std::string destination = (fs::path(targetFolder) / name).string();
        
        if (FileSystem::exists(destination)) {
            logger->info("File " + name + " already exists at " + targetFolder + ", skipping copy.");
            result.status = FileResultStatus::SKIPPED;
            report.batch.files.push_back(result);
            continue;
        }
        
        ProgressReporter progress(logger, "Copying " + name + " to " + targetFolder,
                                  FileSystem::getFileSize(source));
        std::string error;
        if (FileSystem::copyFileChunked(source, destination, error,
                [&progress](uint64_t done, uint64_t) { progress.update(done); }, interrupted)) {
            result.status = FileResultStatus::COPIED;
            result.bytes = FileSystem::getFileSize(destination);
            logger->info("Copied " + name + " to " + targetFolder);
        } else {
            result.status = FileResultStatus::FAILED;
            result.error = error;
            logger->error("Failed to copy " + name + " to " + targetFolder + ": " + error);
        }
        report.batch.files.push_back(result);
    }
}

TaskStatus VolumeCopyTask::getStatus() const {
    return status;
}
