#include "TransferLock.hpp"

TransferLock::TransferLock() : active(false) {
}

bool TransferLock::tryBegin() {
    std::lock_guard<std::mutex> guard(mutex);
    if (active) {
        return false;
    }
    active = true;
    return true;
}

template <typename Predicate>
bool TransferLock::waitFor(std::unique_lock<std::mutex>& lock, Predicate ready,
                           std::chrono::milliseconds timeout, const std::atomic<bool>* interrupted) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!ready()) {
        if (interrupted && interrupted->load()) {
            return false;
        }
        auto wakeAt = std::chrono::steady_clock::now() + INTERRUPT_CHECK_INTERVAL;
        if (timeout != std::chrono::milliseconds::zero()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            if (deadline < wakeAt) {
                wakeAt = deadline;
            }
        }
        idleCv.wait_until(lock, wakeAt);
    }
    return true;
}

bool TransferLock::acquire(std::chrono::milliseconds timeout, const std::atomic<bool>* interrupted) {
    std::unique_lock<std::mutex> lock(mutex);
    if (!waitFor(lock, [this]() { return !active; }, timeout, interrupted)) {
        return false;
    }
    active = true;
    return true;
}

bool TransferLock::waitUntilIdle(std::chrono::milliseconds timeout, const std::atomic<bool>* interrupted) const {
    std::unique_lock<std::mutex> lock(mutex);
    return waitFor(lock, [this]() { return !active; }, timeout, interrupted);
}

void TransferLock::end() {
    {
        std::lock_guard<std::mutex> guard(mutex);
        active = false;
    }
    idleCv.notify_all();
}

bool TransferLock::isActive() const {
    std::lock_guard<std::mutex> guard(mutex);
    return active;
}

TransferGuard::TransferGuard(TransferLock& transferLock, std::chrono::milliseconds timeout,
                             const std::atomic<bool>* interrupted)
    : lock(transferLock), owned(transferLock.acquire(timeout, interrupted)) {
}

TransferGuard::~TransferGuard() {
    release();
}

bool TransferGuard::owns() const {
    return owned;
}

void TransferGuard::release() {
    if (owned) {
        owned = false;
        lock.end();
    }
}
