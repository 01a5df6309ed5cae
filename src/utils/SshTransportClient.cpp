#include "SshTransportClient.hpp"
#include "HostKeyFingerprint.hpp"
#include "RemoteListing.hpp"
#include "../core/Errors.hpp"
#include <cerrno>
#include <cstring>
#include <mutex>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

// SFTP读取块大小
static const size_t READ_CHUNK_SIZE = 32 * 1024;
// 会话阻塞操作超时（毫秒）
static const long SESSION_TIMEOUT_MS = 60 * 1000;

static std::once_flag libssh2InitFlag;

namespace {

// 打开的SFTP文件句柄，离开作用域自动关闭
class SftpHandle {
public:
    explicit SftpHandle(LIBSSH2_SFTP_HANDLE* h) : handle(h) {}
    ~SftpHandle() {
        if (handle) {
            libssh2_sftp_close_handle(handle);
        }
    }
    SftpHandle(const SftpHandle&) = delete;
    SftpHandle& operator=(const SftpHandle&) = delete;

    LIBSSH2_SFTP_HANDLE* get() const { return handle; }

private:
    LIBSSH2_SFTP_HANDLE* handle;
};

}  // namespace

std::unique_ptr<TransportClient> createSshTransportClient() {
    return std::make_unique<SshTransportClient>();
}

SshTransportClient::SshTransportClient() : sock(-1), session(nullptr), sftp(nullptr) {
    std::call_once(libssh2InitFlag, []() {
        libssh2_init(0);
    });
}

SshTransportClient::~SshTransportClient() {
    disconnect();
}

std::string SshTransportClient::lastError() const {
    if (!session) {
        return "no session";
    }
    char* message = nullptr;
    int length = 0;
    libssh2_session_last_error(session, &message, &length, 0);
    return message ? std::string(message, static_cast<size_t>(length)) : "unknown error";
}

std::string SshTransportClient::sftpError(const std::string& what, const std::string& path) const {
    unsigned long code = sftp ? libssh2_sftp_last_error(sftp) : 0;
    return what + " " + path + " on " + host + " failed: " + lastError() +
           " (sftp status " + std::to_string(code) + ")";
}

void SshTransportClient::openSocket(const SessionOptions& options) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    
    struct addrinfo* result = nullptr;
    std::string port = std::to_string(options.port);
    int rc = ::getaddrinfo(options.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw TransportError("Cannot resolve " + options.host + ": " + gai_strerror(rc));
    }
    
    std::string lastFailure = "no addresses";
    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastFailure = std::strerror(errno);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            sock = fd;
            break;
        }
        lastFailure = std::strerror(errno);
        ::close(fd);
    }
    ::freeaddrinfo(result);
    
    if (sock < 0) {
        throw TransportError("Cannot connect to " + options.host + ":" + port + ": " + lastFailure);
    }
}

void SshTransportClient::verifyHostKey(const SessionOptions& options) {
    if (options.hostKeyFingerprint.empty()) {
        return;
    }
    size_t length = 0;
    int type = 0;
    const char* key = libssh2_session_hostkey(session, &length, &type);
    if (!key) {
        throw TransportError("Cannot read host key of " + options.host + ": " + lastError());
    }
    std::string actual = HostKeyFingerprint::sha256(reinterpret_cast<const unsigned char*>(key), length);
    if (!HostKeyFingerprint::matches(options.hostKeyFingerprint, actual)) {
        // 主机密钥不匹配视为认证失败，不重试
        throw AuthError("Host key mismatch for " + options.host + ": expected " +
                        options.hostKeyFingerprint + ", got " + actual);
    }
}

void SshTransportClient::connect(const SessionOptions& options) {
    disconnect();
    host = options.host;
    
    try {
        openSocket(options);
        
        session = libssh2_session_init();
        if (!session) {
            throw TransportError("Cannot create SSH session for " + host);
        }
        libssh2_session_set_blocking(session, 1);
        libssh2_session_set_timeout(session, SESSION_TIMEOUT_MS);
        
        if (libssh2_session_handshake(session, sock) != 0) {
            throw TransportError("SSH handshake with " + host + " failed: " + lastError());
        }
        
        verifyHostKey(options);
        
        int rc = libssh2_userauth_password(session, options.username.c_str(), options.password.c_str());
        if (rc == LIBSSH2_ERROR_AUTHENTICATION_FAILED || rc == LIBSSH2_ERROR_PASSWORD_EXPIRED) {
            throw AuthError("Authentication failed for server " + host + ".");
        }
        if (rc != 0) {
            throw TransportError("SSH authentication with " + host + " failed: " + lastError());
        }
        
        sftp = libssh2_sftp_init(session);
        if (!sftp) {
            throw TransportError("Cannot open SFTP channel on " + host + ": " + lastError());
        }
    } catch (...) {
        disconnect();
        throw;
    }
}

void SshTransportClient::disconnect() {
    if (sftp) {
        libssh2_sftp_shutdown(sftp);
        sftp = nullptr;
    }
    if (session) {
        libssh2_session_disconnect(session, "backupsync closing session");
        libssh2_session_free(session);
        session = nullptr;
    }
    if (sock >= 0) {
        ::close(sock);
        sock = -1;
    }
}

bool SshTransportClient::isConnected() const {
    return session != nullptr && sftp != nullptr;
}

std::string SshTransportClient::execute(const std::string& command) {
    LIBSSH2_CHANNEL* channel = libssh2_channel_open_session(session);
    if (!channel) {
        throw TransportError("Cannot open exec channel on " + host + ": " + lastError());
    }
    
    std::string output;
    std::string errors;
    char buffer[4096];
    bool failed = libssh2_channel_exec(channel, command.c_str()) != 0;
    
    while (!failed) {
        ssize_t n = libssh2_channel_read(channel, buffer, sizeof(buffer));
        if (n > 0) {
            output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else {
            failed = true;
        }
    }
    if (!failed) {
        ssize_t n;
        while ((n = libssh2_channel_read_stderr(channel, buffer, sizeof(buffer))) > 0) {
            errors.append(buffer, static_cast<size_t>(n));
        }
    }
    
    std::string failure = failed ? lastError() : "";
    libssh2_channel_close(channel);
    int exitStatus = libssh2_channel_get_exit_status(channel);
    libssh2_channel_free(channel);
    
    if (failed) {
        throw TransportError("Remote command failed on " + host + ": " + failure);
    }
    if (exitStatus != 0 && output.empty()) {
        throw TransportError("Remote command '" + command + "' on " + host + " exited with " +
                             std::to_string(exitStatus) + ": " + errors);
    }
    return output;
}

std::vector<RemoteFileEntry> SshTransportClient::list(const std::string& remotePath) {
    if (!isConnected()) {
        throw TransportError("Not connected");
    }
    return RemoteListing::parse(execute(RemoteListing::command(remotePath)));
}

uint64_t SshTransportClient::stat(const std::string& remotePath) {
    if (!isConnected()) {
        throw TransportError("Not connected");
    }
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    if (libssh2_sftp_stat(sftp, remotePath.c_str(), &attrs) != 0) {
        throw TransportError(sftpError("stat", remotePath));
    }
    return (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) ? attrs.filesize : 0;
}

void SshTransportClient::streamTo(const std::string& remotePath, std::ostream& sink,
                                  const ProgressCallback& onProgress) {
    uint64_t total = stat(remotePath);
    SftpHandle handle(libssh2_sftp_open(sftp, remotePath.c_str(), LIBSSH2_FXF_READ, 0));
    if (!handle.get()) {
        throw TransportError(sftpError("open", remotePath));
    }
    
    std::vector<char> buffer(READ_CHUNK_SIZE);
    uint64_t done = 0;
    while (true) {
        ssize_t n = libssh2_sftp_read(handle.get(), buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        if (n < 0) {
            throw TransportError(sftpError("read", remotePath));
        }
        sink.write(buffer.data(), n);
        if (!sink) {
            throw TransportError("Local write failed while downloading " + remotePath);
        }
        done += static_cast<uint64_t>(n);
        // 取消只在块之间检查
        if (onProgress && !onProgress(done, total)) {
            throw InterruptedError("Download of " + remotePath + " interrupted");
        }
    }
}
