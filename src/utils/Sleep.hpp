#pragma once
#include <atomic>
#include <chrono>
#include <thread>

// 分段睡眠，期间检查中断标志；被中断返回false
inline bool sleepUnlessInterrupted(std::chrono::milliseconds duration, const std::atomic<bool>* interrupted) {
    const auto step = std::chrono::milliseconds(100);
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        if (interrupted && interrupted->load()) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(remaining < step ? remaining : step);
    }
    return !(interrupted && interrupted->load());
}
