#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// 分块拷贝的块大小：1 MiB
constexpr size_t COPY_CHUNK_SIZE = 1024 * 1024;

// 未完成拷贝使用的临时后缀
constexpr const char* PARTIAL_SUFFIX = ".partial";

class FileSystem {
public:
    // 进度回调：已完成字节数，总字节数
    using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

    // 检查文件或目录是否存在
    static bool exists(const std::string& path);

    // 创建目录（包括父目录）
    static bool createDirectories(const std::string& path);

    // 列出目录下的普通文件名（不递归），目录不存在时返回空集合
    static std::set<std::string> listFileNames(const std::string& directory);

    // 把任意文件名映射为安全的本地文件名：[A-Za-z0-9 ._-] 以外的字符替换为 '_'
    static std::string sanitizeFileName(const std::string& name);

    // 按块复制文件，先写入 destination.partial，完成后重命名
    // 中断时删除临时文件并抛出 InterruptedError
    static bool copyFileChunked(const std::string& source, const std::string& destination,
                                std::string& error,
                                const ProgressCallback& progress = {},
                                const std::atomic<bool>* interrupted = nullptr,
                                size_t chunkSize = COPY_CHUNK_SIZE);

    // 原子重命名（同一文件系统内）
    static bool renameFile(const std::string& from, const std::string& to, std::string& error);

    // 设置访问/修改时间为给定的epoch秒
    static bool setModificationTime(const std::string& path, int64_t epochSeconds);

    // 读取修改时间（epoch秒），失败返回-1
    static int64_t getModificationTime(const std::string& path);

    // 获取文件大小
    static uint64_t getFileSize(const std::string& filePath);

    // 删除单个文件
    static bool removeFile(const std::string& path);

    // 删除目录及其全部内容
    static bool removeDirectory(const std::string& path, std::string& error);
};
