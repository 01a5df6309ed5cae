#pragma once
#include <string>
#include "Types.hpp"
#include "models/Volume.hpp"

class Alerts;
class IUserPrompt;
class RemovableVolumeState;
class TransferLock;
class VolumeEnumerator;

// 安全弹出：有传输进行时拒绝
class VolumeEjector {
private:
    VolumeEnumerator& enumerator;
    RemovableVolumeState& state;
    TransferLock& transferLock;
    Alerts* alerts;
    IUserPrompt* prompt;
    bool forgetOnEject;

public:
    VolumeEjector(VolumeEnumerator& volumeEnumerator, RemovableVolumeState& sharedState, TransferLock& lock,
                  Alerts* alertSink, IUserPrompt* userPrompt = nullptr, bool forgetVolumeOnEject = true);

    // prompt为空时不询问直接弹出
    EjectResult safeEject(const RemovableVolume& volume);

    // 弹出当前挂载的卷
    EjectResult safeEjectCurrent();
};
