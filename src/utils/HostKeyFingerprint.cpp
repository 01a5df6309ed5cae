#include "HostKeyFingerprint.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <vector>

std::string HostKeyFingerprint::sha256(const unsigned char* key, size_t length) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int digestLength = 0;
    if (EVP_Digest(key, length, digest, &digestLength, EVP_sha256(), nullptr) != 1) {
        return "";
    }
    
    // base64输出长度：4 * ceil(n / 3) + 结尾的'\0'
    std::vector<unsigned char> encoded(4 * ((digestLength + 2) / 3) + 1);
    int encodedLength = EVP_EncodeBlock(encoded.data(), digest, static_cast<int>(digestLength));
    if (encodedLength <= 0) {
        return "";
    }
    std::string base64(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(encodedLength));
    while (!base64.empty() && base64.back() == '=') {
        base64.pop_back();
    }
    return "SHA256:" + base64;
}

static std::string stripPadding(std::string value) {
    while (!value.empty() && value.back() == '=') {
        value.pop_back();
    }
    return value;
}

bool HostKeyFingerprint::matches(const std::string& expected, const std::string& actual) {
    if (expected.empty() || actual.empty()) {
        return false;
    }
    return stripPadding(expected) == stripPadding(actual);
}
