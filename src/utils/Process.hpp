#pragma once
#include <string>
#include <vector>

class Process {
public:
    // fork/exec执行命令并等待结束，input非空时写入子进程stdin
    // 返回退出码；无法启动返回-1，exec失败返回127
    // 调用方需在启动时忽略SIGPIPE，否则子进程提前退出会终止本进程
    static int run(const std::vector<std::string>& argv, const std::string& input = "");

    // 拼接命令行，用于日志
    static std::string describe(const std::vector<std::string>& argv);
};
