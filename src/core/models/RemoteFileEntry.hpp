#pragma once
#include <cstdint>
#include <string>

// 远程目录列表中的一项（不持久化）
struct RemoteFileEntry {
    std::string fileName;
    uint64_t size = 0;
    int64_t modificationTime = 0;   // epoch秒

    bool operator==(const RemoteFileEntry& other) const {
        return fileName == other.fileName && size == other.size &&
               modificationTime == other.modificationTime;
    }
};
