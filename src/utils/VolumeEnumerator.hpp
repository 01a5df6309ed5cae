#pragma once
#include <memory>
#include <string>
#include <vector>
#include "../core/models/Volume.hpp"

// 枚举当前挂载的可移动卷
class VolumeEnumerator {
public:
    virtual ~VolumeEnumerator() = default;

    virtual std::vector<RemovableVolume> enumerate() = 0;

    // 卸载卷，失败时error给出原因
    virtual bool eject(const RemovableVolume& volume, std::string& error) = 0;
};

// Linux实现：/proc/mounts + /sys/class/block
class LinuxVolumeEnumerator : public VolumeEnumerator {
private:
    std::string mountsFile;
    std::string sysBlockDir;

public:
    LinuxVolumeEnumerator(const std::string& mounts = "/proc/mounts",
                          const std::string& sysBlock = "/sys/class/block");

    std::vector<RemovableVolume> enumerate() override;
    bool eject(const RemovableVolume& volume, std::string& error) override;

    // 设备（或其所在磁盘）是否可移动
    bool isRemovableDevice(const std::string& devicePath) const;
};

// 工厂函数，创建平台特定的枚举器
std::unique_ptr<VolumeEnumerator> createVolumeEnumerator();
