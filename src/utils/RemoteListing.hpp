#pragma once
#include <string>
#include <vector>
#include "../core/models/RemoteFileEntry.hpp"

// 解析 `ls -lt --time-style=+%s` 的输出
class RemoteListing {
public:
    // 远端执行的列表命令
    static std::string command(const std::string& remotePath);

    // 解析一行：perms links owner group size mtime name...
    // 字段不足、数字无效或不是普通文件时返回false
    static bool parseLine(const std::string& line, RemoteFileEntry& entry);

    // 解析整个输出，无法解析的行被静默跳过
    static std::vector<RemoteFileEntry> parse(const std::string& output);

    // 单引号转义，用于拼接shell命令
    static std::string shellQuote(const std::string& value);
};
