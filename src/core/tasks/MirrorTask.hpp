#pragma once
#include <atomic>
#include <set>
#include <string>
#include <vector>
#include "../Types.hpp"

class Alerts;
struct ServerConfig;

// 把主备份目录中缺少的文件（按文件名）复制到各二级目录
// 不比较内容和大小：目标中存在同名文件即视为已同步
class MirrorTask {
private:
    std::string primaryPath;
    std::vector<std::string> secondaryPaths;
    Alerts* alerts;
    const ServerConfig* config;
    const std::atomic<bool>* interrupted;
    TaskStatus status;

    void syncRoot(const std::set<std::string>& primaryNames, const std::string& secondaryPath,
                  MirrorReport& report);

public:
    MirrorTask(const std::string& primary, const std::vector<std::string>& secondaries, Alerts* alertSink,
               const ServerConfig* serverConfig = nullptr, const std::atomic<bool>* interruptFlag = nullptr);

    // 调用者负责持有TransferLock；中断时抛出InterruptedError
    MirrorReport execute();
    TaskStatus getStatus() const;

    // primary - secondary，按文件名排序
    static std::vector<std::string> missingFiles(const std::set<std::string>& primaryNames,
                                                 const std::set<std::string>& secondaryNames);
};
