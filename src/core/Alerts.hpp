#pragma once
#include <string>

class ILogger;
class INotifier;
class IMailer;
struct ServerConfig;

// 把一次结果同时写日志、发桌面通知、按服务器设置发邮件
// 通知和邮件失败只记录日志，不向上抛出
class Alerts {
private:
    ILogger* logger;
    INotifier* notifier;
    IMailer* mailer;

    void notifySafely(const std::string& title, const std::string& body, const ServerConfig* config);
    void mailSafely(const std::string& subject, const std::string& body, const ServerConfig* config);

public:
    Alerts(ILogger* log, INotifier* notify = nullptr, IMailer* mail = nullptr);

    ILogger* getLogger() const;

    // config 非空时遵守该服务器的桌面通知开关
    void info(const std::string& title, const std::string& body, const ServerConfig* config = nullptr);
    void warning(const std::string& title, const std::string& body, const ServerConfig* config = nullptr);
    void success(const std::string& title, const std::string& body, const ServerConfig* config);
    void failure(const std::string& title, const std::string& body, const ServerConfig* config);
};
