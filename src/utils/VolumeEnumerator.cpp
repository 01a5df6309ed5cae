#include "VolumeEnumerator.hpp"
#include "FileSystem.hpp"
#include "Process.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mntent.h>
#include <sys/mount.h>

std::unique_ptr<VolumeEnumerator> createVolumeEnumerator() {
    return std::make_unique<LinuxVolumeEnumerator>();
}

LinuxVolumeEnumerator::LinuxVolumeEnumerator(const std::string& mounts, const std::string& sysBlock)
    : mountsFile(mounts), sysBlockDir(sysBlock) {
}

static bool readFlag(const fs::path& path) {
    std::ifstream in(path);
    int value = 0;
    return (in >> value) && value == 1;
}

bool LinuxVolumeEnumerator::isRemovableDevice(const std::string& devicePath) const {
    std::error_code ec;
    // /dev/disk/by-label 之类的符号链接先解析成真实设备
    fs::path device = fs::canonical(devicePath, ec);
    if (ec) {
        device = devicePath;
    }
    fs::path sysPath = fs::canonical(fs::path(sysBlockDir) / device.filename(), ec);
    if (ec) {
        return false;
    }
    
    // 分区本身没有removable属性，看所在磁盘
    if (readFlag(sysPath / "removable") || readFlag(sysPath.parent_path() / "removable")) {
        return true;
    }
    // USB移动硬盘通常报告removable=0
    return sysPath.string().find("/usb") != std::string::npos;
}

std::vector<RemovableVolume> LinuxVolumeEnumerator::enumerate() {
    std::vector<RemovableVolume> volumes;
    
    FILE* mounts = ::setmntent(mountsFile.c_str(), "r");
    if (!mounts) {
        mounts = ::setmntent("/etc/mtab", "r");
    }
    if (!mounts) {
        return volumes;
    }
    
    char buf[4096];
    struct mntent entry;
    while (::getmntent_r(mounts, &entry, buf, sizeof(buf)) != nullptr) {
        std::string device = entry.mnt_fsname;
        if (device.compare(0, 5, "/dev/") != 0) {
            continue;
        }
        if (!isRemovableDevice(device)) {
            continue;
        }
        bool seen = false;
        for (const auto& v : volumes) {
            if (v.id == device) {
                seen = true;
                break;
            }
        }
        if (seen) {
            continue;
        }
        RemovableVolume volume;
        volume.id = device;
        volume.mountPoint = entry.mnt_dir;
        volume.label = fs::path(volume.mountPoint).filename().string();
        volumes.push_back(volume);
    }
    ::endmntent(mounts);
    return volumes;
}

bool LinuxVolumeEnumerator::eject(const RemovableVolume& volume, std::string& error) {
    if (::umount(volume.mountPoint.c_str()) == 0) {
        return true;
    }
    int err = errno;
    if (err != EPERM) {
        error = "umount " + volume.mountPoint + " failed: " + std::strerror(err);
        return false;
    }
    
    // 非root用户交给udisks
    std::vector<std::string> argv = {"udisksctl", "unmount", "-b", volume.id};
    int rc = Process::run(argv);
    if (rc != 0) {
        error = Process::describe(argv) + " exited with " + std::to_string(rc);
        return false;
    }
    return true;
}
