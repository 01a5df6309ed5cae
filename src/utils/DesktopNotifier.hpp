#pragma once
#include "Notifier.hpp"
#include <string>

class ILogger;

// 通过 notify-send 发送桌面通知
class DesktopNotifier : public INotifier {
private:
    ILogger* logger;
    bool enabled;
    int timeoutSeconds;

public:
    DesktopNotifier(ILogger* log, bool enable = true, int timeout = 10);
    void notify(const std::string& title, const std::string& body) override;
};
