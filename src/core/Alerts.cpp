#include "Alerts.hpp"
#include "models/ServerConfig.hpp"
#include "../utils/ILogger.hpp"
#include "../utils/Notifier.hpp"
#include <exception>

Alerts::Alerts(ILogger* log, INotifier* notify, IMailer* mail)
    : logger(log), notifier(notify), mailer(mail) {
}

ILogger* Alerts::getLogger() const {
    return logger;
}

void Alerts::notifySafely(const std::string& title, const std::string& body, const ServerConfig* config) {
    if (!notifier || (config && !config->notifyDesktop)) {
        return;
    }
    try {
        notifier->notify(title, body);
    } catch (const std::exception& e) {
        logger->error("Failed to show notification: " + std::string(e.what()));
    }
}

void Alerts::mailSafely(const std::string& subject, const std::string& body, const ServerConfig* config) {
    if (!mailer || !config || !config->sendMail) {
        return;
    }
    try {
        mailer->send(subject, body);
    } catch (const std::exception& e) {
        logger->error("Failed to send email: " + std::string(e.what()));
    }
}

void Alerts::info(const std::string& title, const std::string& body, const ServerConfig* config) {
    logger->info(body);
    notifySafely(title, body, config);
}

void Alerts::warning(const std::string& title, const std::string& body, const ServerConfig* config) {
    logger->warn(body);
    notifySafely(title, body, config);
}

void Alerts::success(const std::string& title, const std::string& body, const ServerConfig* config) {
    logger->info(body);
    mailSafely(title, body, config);
    notifySafely(title, body, config);
}

void Alerts::failure(const std::string& title, const std::string& body, const ServerConfig* config) {
    logger->error(body);
    mailSafely(title, body, config);
    notifySafely(title, body, config);
}
