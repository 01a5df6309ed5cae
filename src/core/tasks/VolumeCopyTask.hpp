#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include "../Types.hpp"

class Alerts;
class TransferLock;
struct ServerConfig;

// 把主备份目录复制到可移动卷上的目标目录，目标中已存在的同名文件跳过
class VolumeCopyTask {
private:
    std::string sourceDir;
    std::string targetFolder;
    TransferLock& transferLock;
    Alerts* alerts;
    std::chrono::milliseconds lockTimeout;
    const std::atomic<bool>* interrupted;
    const ServerConfig* config;
    TaskStatus status;

    void copyAll(CopyReport& report);

public:
    VolumeCopyTask(const std::string& source, const std::string& target, TransferLock& lock, Alerts* alertSink,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(),
                   const std::atomic<bool>* interruptFlag = nullptr,
                   const ServerConfig* serverConfig = nullptr);

    // 等待其它传输结束后再开始；中断在这里被捕获并记录
    CopyReport execute();
    TaskStatus getStatus() const;
};
