#pragma once
#include <stdexcept>
#include <string>

// 认证失败：永久错误，不重试
class AuthError : public std::runtime_error {
public:
    explicit AuthError(const std::string& message) : std::runtime_error(message) {}
};

// 网络/传输错误：可重试，超过次数后视为永久失败
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

// 用户或系统中断（SIGINT/SIGTERM）
class InterruptedError : public std::runtime_error {
public:
    explicit InterruptedError(const std::string& message) : std::runtime_error(message) {}
};

// 配置文件无法读取或没有有效的服务器
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};
