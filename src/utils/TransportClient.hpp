#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "../core/models/RemoteFileEntry.hpp"

// 远程会话参数
struct SessionOptions {
    std::string host;
    uint16_t port = 22;
    std::string username;
    std::string password;
    std::string hostKeyFingerprint;   // "SHA256:..."，为空时不校验
};

// 远程会话 + 文件传输通道
// 所有操作都是阻塞的；错误通过 AuthError / TransportError / InterruptedError 抛出
class TransportClient {
public:
    // 已传输字节数，总字节数；返回false表示取消
    using ProgressCallback = std::function<bool(uint64_t, uint64_t)>;

    virtual ~TransportClient() = default;

    virtual void connect(const SessionOptions& options) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // 列出远程目录中的普通文件，保持远程列表顺序
    virtual std::vector<RemoteFileEntry> list(const std::string& remotePath) = 0;

    // 远程文件大小
    virtual uint64_t stat(const std::string& remotePath) = 0;

    // 把远程文件写入sink，每个块之后回调进度
    virtual void streamTo(const std::string& remotePath, std::ostream& sink,
                          const ProgressCallback& onProgress) = 0;
};

// 每次拉取创建一个新的客户端
using TransportFactory = std::function<std::unique_ptr<TransportClient>()>;

// libssh2 实现
std::unique_ptr<TransportClient> createSshTransportClient();
