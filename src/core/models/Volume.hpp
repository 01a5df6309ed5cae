#pragma once
#include <string>
#include "ServerConfig.hpp"

// 一个已挂载的可移动卷
struct RemovableVolume {
    std::string id;          // 设备路径，例如 /dev/sdb1
    std::string mountPoint;  // 拷贝的基准目录
    std::string label;

    bool operator==(const RemovableVolume& other) const {
        return id == other.id && mountPoint == other.mountPoint;
    }
};

// 监视线程放入队列、由主循环消费的拷贝请求
struct TransferRequest {
    RemovableVolume volume;
    ServerConfig config;
};
