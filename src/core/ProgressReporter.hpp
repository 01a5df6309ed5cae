#pragma once
#include <cstdint>
#include <string>
#include "../utils/ILogger.hpp"

// 按10%步长输出传输进度（DEBUG级别）
class ProgressReporter {
private:
    ILogger* logger;
    std::string label;
    uint64_t total;
    int lastStep;

public:
    ProgressReporter(ILogger* log, const std::string& what, uint64_t totalBytes)
        : logger(log), label(what), total(totalBytes), lastStep(-1) {}

    void update(uint64_t done) {
        if (!logger || total == 0) {
            return;
        }
        int step = static_cast<int>((done * 10) / total);
        if (step > 10) step = 10;
        if (step != lastStep) {
            lastStep = step;
            logger->debug(label + ": " + std::to_string(step * 10) + "% (" + std::to_string(done) + "/" +
                          std::to_string(total) + " bytes)");
        }
    }
};
