#pragma once
#include "TransportClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

// 基于libssh2的会话：密码认证 + SFTP读取 + exec列目录
class SshTransportClient : public TransportClient {
private:
    int sock;
    LIBSSH2_SESSION* session;
    LIBSSH2_SFTP* sftp;
    std::string host;

    // libssh2最近一次错误的描述
    std::string lastError() const;
    std::string sftpError(const std::string& what, const std::string& path) const;
    void openSocket(const SessionOptions& options);
    void verifyHostKey(const SessionOptions& options);
    std::string execute(const std::string& command);

public:
    SshTransportClient();
    ~SshTransportClient() override;

    SshTransportClient(const SshTransportClient&) = delete;
    SshTransportClient& operator=(const SshTransportClient&) = delete;

    void connect(const SessionOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;
    std::vector<RemoteFileEntry> list(const std::string& remotePath) override;
    uint64_t stat(const std::string& remotePath) override;
    void streamTo(const std::string& remotePath, std::ostream& sink,
                  const ProgressCallback& onProgress) override;
};
