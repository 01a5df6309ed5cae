#include "PullTask.hpp"
#include "MirrorTask.hpp"
#include "../Alerts.hpp"
#include "../Errors.hpp"
#include "../ProgressReporter.hpp"
#include "../TransferLock.hpp"
#include "../../utils/FileSystem.hpp"
#include "../../utils/ILogger.hpp"
#include "../../utils/Sleep.hpp"
#include <fstream>
#include <stdexcept>
#include <utility>

PullTask::PullTask(const ServerConfig& serverConfig, TransportFactory factory, TransferLock& lock,
                   Alerts* alertSink, const PullSettings& pullSettings,
                   const std::atomic<bool>* interruptFlag)
    : config(serverConfig), transportFactory(std::move(factory)), transferLock(lock), alerts(alertSink),
      settings(pullSettings), interrupted(interruptFlag), status(TaskStatus::PENDING) {}

bool PullTask::isInterrupted() const {
    return interrupted && interrupted->load();
}

std::vector<RemoteFileEntry> PullTask::selectNewFiles(const std::vector<RemoteFileEntry>& remote,
                                                      const std::set<std::string>& localNames) {
    std::vector<RemoteFileEntry> selected;
    std::set<std::string> taken;
    for (const auto& entry : remote) {
        std::string sanitized = FileSystem::sanitizeFileName(entry.fileName);
        if (localNames.count(sanitized) || taken.count(sanitized)) {
            continue;
        }
        taken.insert(sanitized);
        selected.push_back(entry);
    }
    return selected;
}

std::string PullTask::stagingDirectory(const std::string& primaryBackupPath) {
    return (fs::path(primaryBackupPath) / STAGING_DIR_NAME).string();
}

std::string PullTask::remotePath(const std::string& directory, const std::string& fileName) {
    if (directory.empty()) {
        return fileName;
    }
    if (directory.back() == '/') {
        return directory + fileName;
    }
    return directory + "/" + fileName;
}

std::unique_ptr<TransportClient> PullTask::openSession() {
    ILogger* logger = alerts->getLogger();
    SessionOptions options;
    options.host = config.address;
    options.port = config.port;
    options.username = config.username;
    options.password = config.password;
    options.hostKeyFingerprint = config.hostKeyFingerprint;
    
    int attempts = settings.connectAttempts > 0 ? settings.connectAttempts : 1;
    for (int attempt = 1; ; attempt++) {
        std::unique_ptr<TransportClient> client = transportFactory();
        try {
            client->connect(options);
            logger->info("SSH connection established for server " + config.address);
            return client;
        } catch (const TransportError& e) {
            logger->error("Failed to connect to SSH server " + config.address + ": " + e.what());
            if (attempt >= attempts) {
                throw;
            }
            logger->info("Retrying... (" + std::to_string(attempt) + "/" + std::to_string(attempts) + ")");
            if (!sleepUnlessInterrupted(settings.retryDelay, interrupted)) {
                throw InterruptedError("Connection to " + config.address + " interrupted");
            }
        }
    }
}

void PullTask::createBackupDirectories() {
    ILogger* logger = alerts->getLogger();
    if (!FileSystem::createDirectories(config.primaryBackupPath)) {
        throw std::runtime_error("cannot create primary backup directory " + config.primaryBackupPath);
    }
    logger->info("Ensured backup directory exists: " + config.primaryBackupPath);
    
    // 二级目录创建失败留给镜像同步报告
    for (const auto& path : config.secondaryBackupPaths) {
        if (FileSystem::createDirectories(path)) {
            logger->info("Ensured backup directory exists: " + path);
        } else {
            logger->warn("Cannot create backup directory: " + path);
        }
    }
}

FileTransferResult PullTask::downloadFile(TransportClient& client, const RemoteFileEntry& entry,
                                          const std::string& stagingDir) {
    ILogger* logger = alerts->getLogger();
    FileTransferResult result;
    std::string sanitized = FileSystem::sanitizeFileName(entry.fileName);
    result.fileName = sanitized;
    
    std::string tempPath = (fs::path(stagingDir) / (sanitized + PARTIAL_SUFFIX)).string();
    std::string finalPath = (fs::path(config.primaryBackupPath) / sanitized).string();
    
    // 与暂存目录同名的文件无法放进主目录
    if (sanitized == STAGING_DIR_NAME) {
        result.status = FileResultStatus::FAILED;
        result.error = "name is reserved for the staging directory";
        logger->warn("File " + sanitized + " clashes with the staging directory, not downloaded.");
        return result;
    }
    
    // 再次检查：上一次中断的运行可能已经留下了文件
    if (FileSystem::exists(tempPath) || FileSystem::exists(finalPath)) {
        logger->info("File " + sanitized + " already exists, skipping download.");
        result.status = FileResultStatus::SKIPPED;
        return result;
    }
    
    std::string source = remotePath(config.sourcePath, entry.fileName);
    std::string error;
    try {
        uint64_t size = client.stat(source);
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "cannot create staging file " + tempPath;
        } else {
            ProgressReporter progress(logger, "Downloading " + sanitized, size);
            client.streamTo(source, out, [this, &progress](uint64_t done, uint64_t) {
                progress.update(done);
                return !isInterrupted();
            });
            out.close();
            if (!out) {
                error = "failed to write staging file " + tempPath;
            }
        }
    } catch (const TransportError& e) {
        error = e.what();
    } catch (const InterruptedError&) {
        FileSystem::removeFile(tempPath);
        throw;
    }
    
    if (error.empty()) {
        logger->info("Downloaded " + sanitized);
        if (FileSystem::renameFile(tempPath, finalPath, error)) {
            logger->info("Moved " + sanitized + " to " + finalPath);
            if (!FileSystem::setModificationTime(finalPath, entry.modificationTime)) {
                logger->warn("Cannot set modification time on " + finalPath);
            }
        }
    }
    
    if (!error.empty()) {
        FileSystem::removeFile(tempPath);
        result.status = FileResultStatus::FAILED;
        result.error = error;
        alerts->failure("Backup Error", "Failed to copy " + sanitized + ": " + error, &config);
        return result;
    }
    
    result.status = FileResultStatus::DOWNLOADED;
    result.bytes = FileSystem::getFileSize(finalPath);
    
    // 固定限速
    if (settings.throttle.count() > 0 && !sleepUnlessInterrupted(settings.throttle, interrupted)) {
        logger->debug("Throttle pause interrupted after " + sanitized);
    }
    return result;
}

void PullTask::cleanupStaging(const std::string& stagingDir) {
    std::string error;
    if (!FileSystem::removeDirectory(stagingDir, error)) {
        alerts->getLogger()->error("Failed to clean up temporary directory: " + error);
    }
}

PullOutcome PullTask::summarize(PullReport& report) {
    const std::string server = config.address;
    size_t failed = report.batch.failed() + report.mirror.batch.failed() + report.mirror.unavailableRoots.size();
    
    if (failed == 0) {
        report.message = "Backup complete for server " + server + ".";
        alerts->success("Backup Success", report.message, &config);
        return PullOutcome::SUCCESS;
    }
    
    if (report.batch.failed() > 0 && report.batch.transferred() == 0 && report.batch.skipped() == 0) {
        report.message = "Backup failed for server " + server + ": none of " +
                         std::to_string(report.batch.failed()) + " new file(s) could be copied.";
        alerts->failure("Backup Error", report.message, &config);
        return PullOutcome::FAILED;
    }
    
    report.message = "Backup completed with " + std::to_string(failed) + " error(s) for server " + server +
                     " (" + std::to_string(report.batch.transferred()) + " file(s) downloaded).";
    alerts->failure("Backup Partially Complete", report.message, &config);
    return PullOutcome::PARTIAL_SUCCESS;
}

PullReport PullTask::execute() {
    ILogger* logger = alerts->getLogger();
    PullReport report;
    status = TaskStatus::RUNNING;
    logger->info("Starting backup for server " + config.address);
    
    std::unique_ptr<TransportClient> client;
    try {
        client = openSession();
    } catch (const AuthError& e) {
        report.message = e.what();
        alerts->failure("Backup Error", report.message, &config);
        report.outcome = PullOutcome::FAILED;
    } catch (const TransportError& e) {
        report.message = "Failed to connect to SSH server " + config.address + ": " + e.what();
        alerts->failure("Backup Error", report.message, &config);
        report.outcome = PullOutcome::FAILED;
    } catch (const InterruptedError&) {
        report.message = "Backup process interrupted by user.";
        alerts->info("Backup Interrupted", report.message, &config);
        report.outcome = PullOutcome::INTERRUPTED;
    }
    if (!client) {
        status = TaskStatus::FAILED;
        return report;
    }
    
    std::string stagingDir = stagingDirectory(config.primaryBackupPath);
    try {
        createBackupDirectories();
        alerts->info("Backup", "Starting backup process for server " + config.address + ".", &config);
        
        logger->info("Retrieving list of backup files from " + config.sourcePath);
        std::vector<RemoteFileEntry> remoteFiles = client->list(config.sourcePath);
        std::set<std::string> localFiles = FileSystem::listFileNames(config.primaryBackupPath);
        std::vector<RemoteFileEntry> newFiles = selectNewFiles(remoteFiles, localFiles);
        logger->info("New files to download: " + std::to_string(newFiles.size()));
        
        if (newFiles.empty()) {
            report.message = "No new files to download for server " + config.address + ".";
            alerts->info("Backup", report.message, &config);
            report.outcome = PullOutcome::NO_NEW_FILES;
        } else {
            TransferGuard guard(transferLock, settings.lockTimeout, interrupted);
            if (!guard.owns()) {
                if (isInterrupted()) {
                    throw InterruptedError("interrupted while waiting for active transfer");
                }
                throw std::runtime_error("timed out waiting for the active transfer to finish");
            }
            
            if (!FileSystem::createDirectories(stagingDir)) {
                throw std::runtime_error("cannot create staging directory " + stagingDir);
            }
            for (const auto& entry : newFiles) {
                if (isInterrupted()) {
                    throw InterruptedError("backup interrupted");
                }
                report.batch.files.push_back(downloadFile(*client, entry, stagingDir));
            }
            cleanupStaging(stagingDir);
            
            MirrorTask mirror(config.primaryBackupPath, config.secondaryBackupPaths, alerts, &config, interrupted);
            report.mirror = mirror.execute();
            report.outcome = summarize(report);
        }
    } catch (const InterruptedError&) {
        report.message = "Backup process interrupted by user. Exiting...";
        alerts->info("Backup Interrupted", report.message, &config);
        report.outcome = PullOutcome::INTERRUPTED;
    } catch (const std::exception& e) {
        report.message = "Unexpected error occurred during backup: " + std::string(e.what());
        alerts->failure("Backup Error", report.message, &config);
        report.outcome = PullOutcome::FAILED;
    }
    
    client->disconnect();
    logger->info("SSH connection closed.");
    
    status = (report.outcome == PullOutcome::SUCCESS || report.outcome == PullOutcome::NO_NEW_FILES)
                 ? TaskStatus::COMPLETED : TaskStatus::FAILED;
    logger->info("Backup for server " + config.address + " finished: " + toString(report.outcome));
    return report;
}

TaskStatus PullTask::getStatus() const {
    return status;
}
