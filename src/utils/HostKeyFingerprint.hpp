#pragma once
#include <cstddef>
#include <string>

class HostKeyFingerprint {
public:
    // OpenSSH风格的指纹："SHA256:" + 去掉填充的base64(sha256(key))
    // 失败返回空字符串
    static std::string sha256(const unsigned char* key, size_t length);

    // 比较配置中的指纹与计算结果，忽略结尾的 '=' 填充
    static bool matches(const std::string& expected, const std::string& actual);
};
