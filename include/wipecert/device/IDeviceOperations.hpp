#ifndef INCLUDE_WIPECERT_DEVICE_IDEVICEOPERATIONS_HPP
#define INCLUDE_WIPECERT_DEVICE_IDEVICEOPERATIONS_HPP

#include "wipecert/core/CancellationToken.hpp"
#include "wipecert/core/StorageDevice.hpp"
#include <cstdint>
#include <span>

namespace wipecert::device
{

// Low-level erase primitives of one platform. Every mutating call throws on failure
// (DeviceError subclasses, std::system_error, or core::OperationCancelled).
class IDeviceOperations
{
public:
    IDeviceOperations() = default;
    IDeviceOperations(const IDeviceOperations&) = delete;
    IDeviceOperations& operator=(const IDeviceOperations&) = delete;
    IDeviceOperations(IDeviceOperations&&) = delete;
    IDeviceOperations& operator=(IDeviceOperations&&) = delete;
    virtual ~IDeviceOperations() = default;

    // Fills the whole addressable range with `pattern`. Returns the number of bytes written.
    virtual std::uint64_t overwrite(const wipecert::core::StorageDevice& device, std::uint8_t pattern,
                                    const wipecert::core::CancellationToken& token) = 0;

    virtual void trim(const wipecert::core::StorageDevice& device) = 0;
    virtual void secureErase(const wipecert::core::StorageDevice& device) = 0;
    // `secure` requests a user-data erase as part of the format.
    virtual void nvmeFormat(const wipecert::core::StorageDevice& device, bool secure) = 0;
    virtual void cryptoErase(const wipecert::core::StorageDevice& device) = 0;

    // Reads sector `index` into `out` (exactly device.sectorSize bytes). Returns false on a short read.
    [[nodiscard]] virtual bool readSector(const wipecert::core::StorageDevice& device, std::uint64_t index,
                                          std::span<std::uint8_t> out) = 0;

    // Makes the area part of the addressable range so later passes cover it.
    virtual void exposeHiddenArea(const wipecert::core::StorageDevice& device,
                                  const wipecert::core::HiddenArea& area) = 0;
};

} // namespace wipecert::device

#endif // INCLUDE_WIPECERT_DEVICE_IDEVICEOPERATIONS_HPP
