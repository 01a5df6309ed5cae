#pragma once
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>
#include "core/Errors.hpp"
#include "utils/ILogger.hpp"
#include "utils/Notifier.hpp"
#include "utils/TransportClient.hpp"
#include "utils/VolumeEnumerator.hpp"

// 模拟ILogger接口
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, setLogLevel, (LogLevel level), (override));
    MOCK_METHOD(LogLevel, getLogLevel, (), (const, override));
    MOCK_METHOD(void, log, (LogLevel level, const std::string& message), (override));

    // 允许所有日志调用
    void allowAll() {
        using ::testing::_;
        EXPECT_CALL(*this, info(_)).Times(::testing::AnyNumber());
        EXPECT_CALL(*this, error(_)).Times(::testing::AnyNumber());
        EXPECT_CALL(*this, warn(_)).Times(::testing::AnyNumber());
        EXPECT_CALL(*this, debug(_)).Times(::testing::AnyNumber());
        EXPECT_CALL(*this, log(_, _)).Times(::testing::AnyNumber());
        EXPECT_CALL(*this, setLogLevel(_)).Times(::testing::AnyNumber());
        EXPECT_CALL(*this, getLogLevel()).WillRepeatedly(::testing::Return(LogLevel::INFO));
    }
};

class MockNotifier : public INotifier {
public:
    MOCK_METHOD(void, notify, (const std::string& title, const std::string& body), (override));
};

class MockMailer : public IMailer {
public:
    MOCK_METHOD(void, send, (const std::string& subject, const std::string& body), (override));
};

class MockPrompt : public IUserPrompt {
public:
    MOCK_METHOD(bool, confirm, (const std::string& prompt), (override));
    MOCK_METHOD(std::string, chooseOrCreateFolder, (const std::string& basePath), (override));
};

class MockVolumeEnumerator : public VolumeEnumerator {
public:
    MOCK_METHOD(std::vector<RemovableVolume>, enumerate, (), (override));
    MOCK_METHOD(bool, eject, (const RemovableVolume& volume, std::string& error), (override));
};

// 内存中的远程服务器，多个客户端共享
struct FakeRemoteFile {
    RemoteFileEntry entry;
    std::string content;
    bool failStream = false;
};

class FakeRemote {
public:
    std::vector<FakeRemoteFile> files;
    bool rejectPassword = false;
    std::string acceptedPassword;       // 非空时只接受这个密码
    int failingConnects = 0;            // 前N次连接抛出TransportError
    std::atomic<int> connectAttempts{0};
    std::atomic<int> downloads{0};

    void addFile(const std::string& name, const std::string& content, int64_t mtime, bool failStream = false) {
        FakeRemoteFile file;
        file.entry.fileName = name;
        file.entry.size = content.size();
        file.entry.modificationTime = mtime;
        file.content = content;
        file.failStream = failStream;
        files.push_back(file);
    }

    const FakeRemoteFile* find(const std::string& remotePath) const {
        std::string name = remotePath.substr(remotePath.rfind('/') + 1);
        for (const auto& f : files) {
            if (f.entry.fileName == name) {
                return &f;
            }
        }
        return nullptr;
    }

    TransportFactory factory();
};

class FakeTransportClient : public TransportClient {
private:
    FakeRemote& remote;
    bool connected = false;

public:
    explicit FakeTransportClient(FakeRemote& fakeRemote) : remote(fakeRemote) {}

    void connect(const SessionOptions& options) override {
        int attempt = ++remote.connectAttempts;
        if (remote.rejectPassword ||
            (!remote.acceptedPassword.empty() && options.password != remote.acceptedPassword)) {
            throw AuthError("Authentication failed for " + options.username + "@" + options.host);
        }
        if (attempt <= remote.failingConnects) {
            throw TransportError("connection refused");
        }
        connected = true;
    }

    void disconnect() override { connected = false; }

    bool isConnected() const override { return connected; }

    std::vector<RemoteFileEntry> list(const std::string&) override {
        std::vector<RemoteFileEntry> entries;
        for (const auto& f : remote.files) {
            entries.push_back(f.entry);
        }
        return entries;
    }

    uint64_t stat(const std::string& remotePath) override {
        const FakeRemoteFile* file = remote.find(remotePath);
        if (!file) {
            throw TransportError("no such file: " + remotePath);
        }
        return file->content.size();
    }

    void streamTo(const std::string& remotePath, std::ostream& sink, const ProgressCallback& onProgress) override {
        const FakeRemoteFile* file = remote.find(remotePath);
        if (!file || file->failStream) {
            throw TransportError("simulated transfer failure: " + remotePath);
        }
        sink.write(file->content.data(), static_cast<std::streamsize>(file->content.size()));
        if (onProgress && !onProgress(file->content.size(), file->content.size())) {
            throw InterruptedError("transfer cancelled");
        }
        remote.downloads++;
    }
};

inline TransportFactory FakeRemote::factory() {
    return [this]() -> std::unique_ptr<TransportClient> {
        return std::make_unique<FakeTransportClient>(*this);
    };
}
