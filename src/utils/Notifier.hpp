#pragma once
#include <string>

// 桌面通知，尽力而为
class INotifier {
public:
    virtual ~INotifier() = default;
    virtual void notify(const std::string& title, const std::string& body) = 0;
};

// 邮件通知，尽力而为，不重试
class IMailer {
public:
    virtual ~IMailer() = default;
    virtual void send(const std::string& subject, const std::string& body) = 0;
};

// U盘流程中的交互确认
class IUserPrompt {
public:
    virtual ~IUserPrompt() = default;
    virtual bool confirm(const std::string& prompt) = 0;
    // 返回选中或新建的目录，空字符串表示跳过
    virtual std::string chooseOrCreateFolder(const std::string& basePath) = 0;
};
