#pragma once
#include "Notifier.hpp"
#include <string>

class ILogger;

struct MailSettings {
    std::string sender;
    std::string recipient;
    std::string command = "/usr/sbin/sendmail";
};

// 把邮件交给 sendmail 兼容命令（sendmail -t 从stdin读取）
class SendmailMailer : public IMailer {
private:
    ILogger* logger;
    MailSettings settings;

public:
    SendmailMailer(ILogger* log, const MailSettings& mailSettings);
    void send(const std::string& subject, const std::string& body) override;

    // 生成RFC 822格式的邮件文本
    static std::string composeMessage(const MailSettings& settings, const std::string& subject,
                                      const std::string& body);
};
