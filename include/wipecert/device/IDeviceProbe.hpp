#ifndef INCLUDE_WIPECERT_DEVICE_IDEVICEPROBE_HPP
#define INCLUDE_WIPECERT_DEVICE_IDEVICEPROBE_HPP

#include "wipecert/core/StorageDevice.hpp"
#include <vector>

namespace wipecert::device
{

// Enumerates block devices. Fields the platform cannot report are left empty.
class IDeviceProbe
{
public:
    IDeviceProbe() = default;
    IDeviceProbe(const IDeviceProbe&) = delete;
    IDeviceProbe& operator=(const IDeviceProbe&) = delete;
    IDeviceProbe(IDeviceProbe&&) = delete;
    IDeviceProbe& operator=(IDeviceProbe&&) = delete;
    virtual ~IDeviceProbe() = default;

    [[nodiscard]] virtual std::vector<wipecert::core::StorageDevice> listDevices() = 0;
};

} // namespace wipecert::device

#endif // INCLUDE_WIPECERT_DEVICE_IDEVICEPROBE_HPP
