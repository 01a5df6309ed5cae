#include "RemovableMediaWatcher.hpp"
#include "../utils/ILogger.hpp"
#include "../utils/VolumeEnumerator.hpp"
#include <algorithm>
#include <exception>

bool RemovableVolumeState::markPrompted(const std::string& volumeId) {
    std::lock_guard<std::mutex> lock(mutex);
    return prompted.insert(volumeId).second;
}

bool RemovableVolumeState::isPrompted(const std::string& volumeId) const {
    std::lock_guard<std::mutex> lock(mutex);
    return prompted.count(volumeId) > 0;
}

void RemovableVolumeState::forget(const std::string& volumeId) {
    std::lock_guard<std::mutex> lock(mutex);
    prompted.erase(volumeId);
}

void RemovableVolumeState::forgetAll() {
    std::lock_guard<std::mutex> lock(mutex);
    prompted.clear();
}

void RemovableVolumeState::setAttached(const RemovableVolume& volume) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& v : attached) {
        if (v.id == volume.id) {
            v = volume;
            return;
        }
    }
    attached.push_back(volume);
}

void RemovableVolumeState::clearAttached(const std::string& volumeId) {
    std::lock_guard<std::mutex> lock(mutex);
    attached.erase(std::remove_if(attached.begin(), attached.end(),
                                  [&volumeId](const RemovableVolume& v) { return v.id == volumeId; }),
                   attached.end());
}

bool RemovableVolumeState::currentVolume(RemovableVolume& out) const {
    std::lock_guard<std::mutex> lock(mutex);
    if (attached.empty()) {
        return false;
    }
    out = attached.front();
    return true;
}

bool RemovableVolumeState::findAttached(const std::string& volumeId, RemovableVolume& out) const {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& v : attached) {
        if (v.id == volumeId) {
            out = v;
            return true;
        }
    }
    return false;
}

void TransferRequestQueue::push(const TransferRequest& request) {
    std::lock_guard<std::mutex> lock(mutex);
    requests.push(request);
}

bool TransferRequestQueue::tryPop(TransferRequest& out) {
    std::lock_guard<std::mutex> lock(mutex);
    if (requests.empty()) {
        return false;
    }
    out = requests.front();
    requests.pop();
    return true;
}

size_t TransferRequestQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return requests.size();
}

bool TransferRequestQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex);
    return requests.empty();
}

RemovableMediaWatcher::RemovableMediaWatcher(const ServerConfig& serverConfig, VolumeEnumerator& volumeEnumerator,
                                             RemovableVolumeState& sharedState, TransferRequestQueue& requestQueue,
                                             ILogger* log, std::chrono::milliseconds interval,
                                             bool forgetVolumeOnDetach)
    : config(serverConfig), enumerator(volumeEnumerator), state(sharedState), queue(requestQueue), logger(log),
      pollInterval(interval), forgetOnDetach(forgetVolumeOnDetach), running(false) {
}

RemovableMediaWatcher::~RemovableMediaWatcher() {
    stop();
}

size_t RemovableMediaWatcher::pollOnce() {
    std::vector<RemovableVolume> volumes;
    try {
        volumes = enumerator.enumerate();
    } catch (const std::exception& e) {
        logger->error("Failed to enumerate removable volumes: " + std::string(e.what()));
        return 0;
    }
    
    size_t enqueued = 0;
    std::set<std::string> currentIds;
    for (const auto& volume : volumes) {
        currentIds.insert(volume.id);
        if (previousIds.count(volume.id)) {
            continue;
        }
        
        // 新的挂载事件
        logger->info("Removable volume detected: " + volume.id + " at " + volume.mountPoint);
        state.setAttached(volume);
        if (state.markPrompted(volume.id)) {
            queue.push(TransferRequest{volume, config});
            enqueued++;
        } else {
            logger->debug("Volume " + volume.id + " was already offered for backup");
        }
    }
    
    for (const auto& id : previousIds) {
        if (currentIds.count(id)) {
            continue;
        }
        logger->info("Removable volume removed: " + id);
        state.clearAttached(id);
        // 默认只有显式弹出才清除提示记录
        if (forgetOnDetach) {
            state.forget(id);
        }
    }
    
    previousIds = currentIds;
    return enqueued;
}

bool RemovableMediaWatcher::start() {
    if (running) {
        logger->error("Removable media watcher is already running.");
        return false;
    }
    running = true;
    watchThread = std::thread(&RemovableMediaWatcher::watchThreadFunc, this);
    logger->debug("Removable media watcher started for server " + config.displayName());
    return true;
}

void RemovableMediaWatcher::stop() {
    if (!running) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(waitMutex);
        running = false;
    }
    waitCv.notify_one();
    if (watchThread.joinable()) {
        watchThread.join();
    }
    logger->debug("Removable media watcher stopped for server " + config.displayName());
}

bool RemovableMediaWatcher::isRunning() const {
    return running;
}

void RemovableMediaWatcher::watchThreadFunc() {
    while (running) {
        pollOnce();
        
        // 等待下一次轮询，或者直到被停止
        std::unique_lock<std::mutex> lock(waitMutex);
        waitCv.wait_for(lock, pollInterval, [this]() {
            return !running;
        });
    }
}
