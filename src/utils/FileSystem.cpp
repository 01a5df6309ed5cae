#include "FileSystem.hpp"
#include "../core/Errors.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>
#include <utime.h>

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    // 使用symlink_status检查文件是否存在，不解析符号链接
    fs::file_status status = fs::symlink_status(path, ec);
    return status.type() != fs::file_type::not_found && !ec;
}

bool FileSystem::createDirectories(const std::string& path) {
    // 如果目录已存在，直接返回成功
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (!ec && status.type() == fs::file_type::directory) {
        return true;
    }
    
    bool result = fs::create_directories(path, ec);
    if (ec) {
        std::cerr << "Error: Failed to create directories for " << path << " (" << ec.message() << ")" << std::endl;
    }
    return result && !ec;
}

std::set<std::string> FileSystem::listFileNames(const std::string& directory) {
    std::set<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return names;
    }
    
    for (const auto& entry : fs::directory_iterator(directory, fs::directory_options::skip_permission_denied, ec)) {
        std::error_code typeEc;
        if (entry.is_regular_file(typeEc)) {
            names.insert(entry.path().filename().string());
        }
    }
    return names;
}

std::string FileSystem::sanitizeFileName(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        bool allowed = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                       c == ' ' || c == '.' || c == '_' || c == '-';
        result.push_back(allowed ? c : '_');
    }
    return result;
}

bool FileSystem::copyFileChunked(const std::string& source, const std::string& destination,
                                 std::string& error,
                                 const ProgressCallback& progress,
                                 const std::atomic<bool>* interrupted,
                                 size_t chunkSize) {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        error = "cannot open source " + source + ": " + std::strerror(errno);
        return false;
    }
    
    std::string partialPath = destination + PARTIAL_SUFFIX;
    std::ofstream out(partialPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "cannot open destination " + partialPath + ": " + std::strerror(errno);
        return false;
    }
    
    uint64_t total = getFileSize(source);
    uint64_t done = 0;
    std::vector<char> buffer(chunkSize > 0 ? chunkSize : COPY_CHUNK_SIZE);
    
    while (in) {
        // 取消只在块之间检查
        if (interrupted && interrupted->load()) {
            out.close();
            removeFile(partialPath);
            throw InterruptedError("copy of " + source + " interrupted");
        }
        
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        out.write(buffer.data(), got);
        if (!out) {
            error = "write failed on " + partialPath + ": " + std::strerror(errno);
            out.close();
            removeFile(partialPath);
            return false;
        }
        done += static_cast<uint64_t>(got);
        if (progress) {
            progress(done, total);
        }
    }
    
    if (in.bad()) {
        error = "read failed on " + source;
        out.close();
        removeFile(partialPath);
        return false;
    }
    
    out.close();
    if (!out) {
        error = "failed to flush " + partialPath;
        removeFile(partialPath);
        return false;
    }
    
    if (!renameFile(partialPath, destination, error)) {
        removeFile(partialPath);
        return false;
    }
    
    // 保留源文件的修改时间
    int64_t mtime = getModificationTime(source);
    if (mtime >= 0) {
        setModificationTime(destination, mtime);
    }
    return true;
}

bool FileSystem::renameFile(const std::string& from, const std::string& to, std::string& error) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        error = "rename " + from + " -> " + to + " failed: " + ec.message();
        return false;
    }
    return true;
}

bool FileSystem::setModificationTime(const std::string& path, int64_t epochSeconds) {
    struct utimbuf times;
    times.actime = static_cast<time_t>(epochSeconds);
    times.modtime = static_cast<time_t>(epochSeconds);
    return ::utime(path.c_str(), &times) == 0;
}

int64_t FileSystem::getModificationTime(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return -1;
    }
    return static_cast<int64_t>(st.st_mtime);
}

uint64_t FileSystem::getFileSize(const std::string& filePath) {
    std::error_code ec;
    auto size = fs::file_size(filePath, ec);
    return ec ? 0 : size;
}

bool FileSystem::removeFile(const std::string& path) {
    std::error_code ec;
    bool result = fs::remove(path, ec);
    return !ec && result;
}

bool FileSystem::removeDirectory(const std::string& path, std::string& error) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        error = "failed to remove " + path + ": " + ec.message();
        return false;
    }
    return true;
}
