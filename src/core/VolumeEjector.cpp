#include "VolumeEjector.hpp"
#include "Alerts.hpp"
#include "RemovableMediaWatcher.hpp"
#include "TransferLock.hpp"
#include "../utils/ILogger.hpp"
#include "../utils/Notifier.hpp"
#include "../utils/VolumeEnumerator.hpp"

VolumeEjector::VolumeEjector(VolumeEnumerator& volumeEnumerator, RemovableVolumeState& sharedState,
                             TransferLock& lock, Alerts* alertSink, IUserPrompt* userPrompt,
                             bool forgetVolumeOnEject)
    : enumerator(volumeEnumerator), state(sharedState), transferLock(lock), alerts(alertSink), prompt(userPrompt),
      forgetOnEject(forgetVolumeOnEject) {
}

EjectResult VolumeEjector::safeEject(const RemovableVolume& volume) {
    if (transferLock.isActive()) {
        alerts->warning("USB Eject Warning", "Cannot eject USB drive. Active transfer in progress.");
        return EjectResult::REJECTED_BUSY;
    }
    if (prompt && !prompt->confirm("Do you want to safely eject the USB drive " + volume.id + "?")) {
        return EjectResult::DECLINED;
    }
    
    // 占用TransferLock直到卸载完成，避免确认期间开始的传输被打断
    if (!transferLock.tryBegin()) {
        alerts->warning("USB Eject Warning", "Cannot eject USB drive. Active transfer in progress.");
        return EjectResult::REJECTED_BUSY;
    }
    
    EjectResult result = EjectResult::EJECTED;
    std::string error;
    if (enumerator.eject(volume, error)) {
        alerts->getLogger()->info("USB drive " + volume.id + " ejected safely.");
        state.clearAttached(volume.id);
        if (forgetOnEject) {
            state.forget(volume.id);
        }
    } else {
        alerts->failure("USB Eject Error", "Failed to eject USB drive " + volume.id + ": " + error, nullptr);
        result = EjectResult::FAILED;
    }
    transferLock.end();
    return result;
}

EjectResult VolumeEjector::safeEjectCurrent() {
    RemovableVolume volume;
    if (!state.currentVolume(volume)) {
        return EjectResult::NO_VOLUME;
    }
    return safeEject(volume);
}
