#ifndef INCLUDE_WIPECERT_DEVICE_LINUX_LINUXDEVICEFACTORY_HPP
#define INCLUDE_WIPECERT_DEVICE_LINUX_LINUXDEVICEFACTORY_HPP

#include "wipecert/device/IDeviceOperations.hpp"
#include "wipecert/device/IDeviceProbe.hpp"
#include <filesystem>
#include <memory>

namespace wipecert::device
{

struct LinuxProbeOptions final
{
    std::filesystem::path sysBlockRoot{ "/sys/block" };
    std::filesystem::path devRoot{ "/dev" };
    // Runs `hdparm -I` / `hdparm -N` on ATA-style devices for identity, security and HPA facts.
    bool queryHdparm{ true };
};

// Scans sysfs block entries.
[[nodiscard]] std::unique_ptr<IDeviceProbe> makeLinuxDeviceProbe(LinuxProbeOptions options = {});

// pwrite/pread passes, BLKDISCARD, NVMe admin commands and hdparm for ATA security and HPA.
// Overwrite and sector reads also work on regular files.
[[nodiscard]] std::unique_ptr<IDeviceOperations> makeLinuxDeviceOperations();

} // namespace wipecert::device

#endif // INCLUDE_WIPECERT_DEVICE_LINUX_LINUXDEVICEFACTORY_HPP
