#include "DesktopNotifier.hpp"
#include "ILogger.hpp"
#include "Process.hpp"

DesktopNotifier::DesktopNotifier(ILogger* log, bool enable, int timeout)
    : logger(log), enabled(enable), timeoutSeconds(timeout) {
}

void DesktopNotifier::notify(const std::string& title, const std::string& body) {
    if (!enabled) {
        return;
    }
    std::vector<std::string> argv = {
        "notify-send", "-t", std::to_string(timeoutSeconds * 1000), title, body
    };
    int rc = Process::run(argv);
    if (rc != 0) {
        logger->error("Failed to show notification '" + title + "' (exit code " + std::to_string(rc) + ")");
    }
}
