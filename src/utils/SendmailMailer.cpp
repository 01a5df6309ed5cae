#include "SendmailMailer.hpp"
#include "ILogger.hpp"
#include "Process.hpp"

SendmailMailer::SendmailMailer(ILogger* log, const MailSettings& mailSettings)
    : logger(log), settings(mailSettings) {
}

std::string SendmailMailer::composeMessage(const MailSettings& settings, const std::string& subject,
                                           const std::string& body) {
    std::string message;
    if (!settings.sender.empty()) {
        message += "From: " + settings.sender + "\n";
    }
    message += "To: " + settings.recipient + "\n";
    message += "Subject: " + subject + "\n";
    message += "Content-Type: text/plain; charset=utf-8\n";
    message += "\n";
    message += body + "\n";
    return message;
}

void SendmailMailer::send(const std::string& subject, const std::string& body) {
    if (settings.recipient.empty()) {
        logger->warn("Mail requested but no recipient configured: " + subject);
        return;
    }
    std::vector<std::string> argv = {settings.command, "-t"};
    if (!settings.sender.empty()) {
        argv.push_back("-f");
        argv.push_back(settings.sender);
    }
    int rc = Process::run(argv, composeMessage(settings, subject, body));
    if (rc == 0) {
        logger->info("Email sent to " + settings.recipient + ": " + subject);
    } else {
        logger->error("Failed to send email via " + Process::describe(argv) +
                      " (exit code " + std::to_string(rc) + ")");
    }
}
