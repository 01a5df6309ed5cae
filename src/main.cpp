#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include "core/Alerts.hpp"
#include "core/Coordinator.hpp"
#include "core/Errors.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/ConsoleLogger.hpp"
#include "utils/ConsolePrompt.hpp"
#include "utils/DesktopNotifier.hpp"
#include "utils/FileLogger.hpp"
#include "utils/SendmailMailer.hpp"
#include "utils/TransportClient.hpp"
#include "utils/VolumeEnumerator.hpp"

// 进程退出码
constexpr int EXIT_CLEAN = 0;
constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_RUNTIME_ERROR = 2;

static std::atomic<bool> g_interrupted(false);

static void handleSignal(int) {
    g_interrupted = true;
}

static void installSignalHandlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handleSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    
    // 写入已退出的子进程或断开的连接时只返回EPIPE
    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);
}

static void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <path>]\n"
              << "  --config <path>  configuration file (default " << DEFAULT_CONFIG_PATH << ")\n"
              << "  --help           show this message\n";
}

static CoordinatorSettings makeSettings(const AppConfig& config) {
    CoordinatorSettings settings;
    settings.tickInterval = std::chrono::milliseconds(config.tickIntervalMs);
    settings.pollInterval = std::chrono::seconds(config.pollIntervalSeconds);
    settings.lockWaitTimeout = std::chrono::seconds(config.lockWaitTimeoutSeconds);
    settings.forgetVolumeOnDetach = config.forgetVolumeOnDetach;
    settings.runOnStartup = config.runOnStartup;
    settings.pull.connectAttempts = config.connectAttempts;
    settings.pull.retryDelay = std::chrono::seconds(config.connectRetryDelaySeconds);
    settings.pull.throttle = std::chrono::milliseconds(config.throttleMs);
    settings.pull.lockTimeout = settings.lockWaitTimeout;
    return settings;
}

int main(int argc, char* argv[]) {
    std::string configPath = DEFAULT_CONFIG_PATH;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return EXIT_CLEAN;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return EXIT_CONFIG_ERROR;
        }
    }
    
    // 配置加载完成之前只输出到控制台
    ConsoleLogger bootstrapLogger;
    AppConfig config;
    try {
        config = ConfigLoader::loadFile(configPath, &bootstrapLogger);
    } catch (const ConfigError& e) {
        bootstrapLogger.error(e.what());
        return EXIT_CONFIG_ERROR;
    }
    if (config.servers.empty()) {
        bootstrapLogger.error("No valid server configurations found in " + configPath);
        return EXIT_CONFIG_ERROR;
    }
    
    FileLogger logger(config.logFile, config.logLevel);
    if (!logger.isOpen()) {
        bootstrapLogger.warn("Cannot open log file " + config.logFile + ", logging to console only");
    }
    
    installSignalHandlers();
    
    try {
        DesktopNotifier notifier(&logger, config.notifications);
        SendmailMailer mailer(&logger, config.mail);
        ConsolePrompt prompt;
        Alerts alerts(&logger, &notifier, &mailer);
        std::unique_ptr<VolumeEnumerator> volumes = createVolumeEnumerator();
        
        Coordinator coordinator(config.servers, createSshTransportClient, *volumes, &alerts, &prompt,
                                makeSettings(config), &g_interrupted);
        if (!coordinator.start()) {
            return EXIT_CONFIG_ERROR;
        }
        int code = coordinator.run();
        logger.info("Backup agent exiting with status " + std::to_string(code));
        return code;
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal error: ") + e.what());
        return EXIT_RUNTIME_ERROR;
    }
}
