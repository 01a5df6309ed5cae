#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class TaskStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED
};

// 一次远程拉取的最终结果
enum class PullOutcome {
    SUCCESS,
    NO_NEW_FILES,
    PARTIAL_SUCCESS,
    FAILED,
    INTERRUPTED
};

// 单个文件的传输结果
enum class FileResultStatus {
    DOWNLOADED,
    COPIED,
    SKIPPED,
    FAILED
};

enum class ScheduleType {
    STARTUP,
    SCHEDULED
};

// 安全弹出结果
enum class EjectResult {
    EJECTED,
    REJECTED_BUSY,
    DECLINED,
    NO_VOLUME,
    FAILED
};

inline std::string toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "PENDING";
        case TaskStatus::RUNNING: return "RUNNING";
        case TaskStatus::COMPLETED: return "COMPLETED";
        case TaskStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline std::string toString(PullOutcome outcome) {
    switch (outcome) {
        case PullOutcome::SUCCESS: return "SUCCESS";
        case PullOutcome::NO_NEW_FILES: return "NO_NEW_FILES";
        case PullOutcome::PARTIAL_SUCCESS: return "PARTIAL_SUCCESS";
        case PullOutcome::FAILED: return "FAILED";
        case PullOutcome::INTERRUPTED: return "INTERRUPTED";
        default: return "UNKNOWN";
    }
}

inline std::string toString(FileResultStatus status) {
    switch (status) {
        case FileResultStatus::DOWNLOADED: return "DOWNLOADED";
        case FileResultStatus::COPIED: return "COPIED";
        case FileResultStatus::SKIPPED: return "SKIPPED";
        case FileResultStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline std::string toString(ScheduleType type) {
    switch (type) {
        case ScheduleType::STARTUP: return "STARTUP";
        case ScheduleType::SCHEDULED: return "SCHEDULED";
        default: return "UNKNOWN";
    }
}

inline std::string toString(EjectResult result) {
    switch (result) {
        case EjectResult::EJECTED: return "EJECTED";
        case EjectResult::REJECTED_BUSY: return "REJECTED_BUSY";
        case EjectResult::DECLINED: return "DECLINED";
        case EjectResult::NO_VOLUME: return "NO_VOLUME";
        case EjectResult::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

struct FileTransferResult {
    std::string fileName;
    FileResultStatus status;
    std::string error;          // 仅在FAILED时有值
    uint64_t bytes = 0;
};

// 批量传输汇总，供拉取/镜像/U盘拷贝共用
struct BatchReport {
    std::vector<FileTransferResult> files;

    size_t count(FileResultStatus status) const {
        size_t n = 0;
        for (const auto& f : files) {
            if (f.status == status) n++;
        }
        return n;
    }
    size_t transferred() const {
        return count(FileResultStatus::DOWNLOADED) + count(FileResultStatus::COPIED);
    }
    size_t failed() const { return count(FileResultStatus::FAILED); }
    size_t skipped() const { return count(FileResultStatus::SKIPPED); }
    bool hasFailures() const { return failed() > 0; }

    void merge(const BatchReport& other) {
        files.insert(files.end(), other.files.begin(), other.files.end());
    }
};

struct MirrorReport {
    BatchReport batch;
    std::vector<std::string> unavailableRoots; // 无法创建的二级目录
};

struct PullReport {
    PullOutcome outcome = PullOutcome::FAILED;
    BatchReport batch;
    MirrorReport mirror;
    std::string message;
};

struct CopyReport {
    bool performed = false;     // 是否真正执行了拷贝（超时/中断时为false）
    bool interrupted = false;
    std::string targetFolder;
    BatchReport batch;
};
