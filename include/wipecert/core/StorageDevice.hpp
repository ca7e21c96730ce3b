#ifndef INCLUDE_WIPECERT_CORE_STORAGEDEVICE_HPP
#define INCLUDE_WIPECERT_CORE_STORAGEDEVICE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wipecert::core
{

enum class DeviceType : std::uint8_t
{
    HDD,
    SSD,
    NVMe,
    USB,
    Unknown,
};

// Ordered by thoroughness.
enum class EraseMode : std::uint8_t
{
    Quick,
    Full,
    Advanced,
};

enum class HiddenAreaKind : std::uint8_t
{
    HPA,
    DCO,
    SSDReserved,
    VendorSpecific,
};

constexpr std::uint32_t g_defaultSectorSize{ 512U };

struct HiddenArea final
{
    HiddenAreaKind kind{ HiddenAreaKind::HPA };
    std::uint64_t startLba{ 0U };
    std::uint64_t size{ 0U }; // sectors
    std::string description;
};

// Snapshot handed over by the device probe. Every optional field may be absent.
struct StorageDevice final
{
    std::string path;
    std::string name;
    std::uint64_t size{ 0U }; // bytes
    DeviceType type{ DeviceType::Unknown };
    std::optional<std::string> model;
    std::optional<std::string> serial;
    std::optional<std::string> firmwareVersion;
    std::optional<std::string> interfaceType;
    bool supportsSecureErase{ false };
    bool supportsTrim{ false };
    bool supportsCryptoErase{ false };
    bool supportsFormatUnit{ true };
    std::uint32_t sectorSize{ g_defaultSectorSize };
    std::vector<HiddenArea> hiddenAreas;

    [[nodiscard]] std::uint64_t sectorCount() const noexcept
    {
        return (sectorSize == 0U) ? 0U : (size / sectorSize);
    }
};

[[nodiscard]] std::string_view toString(DeviceType type) noexcept;
[[nodiscard]] std::string_view toString(EraseMode mode) noexcept;
[[nodiscard]] std::string_view toString(HiddenAreaKind kind) noexcept;

// Wire names ("HDD", "NVMe", ...) must match exactly.
[[nodiscard]] std::optional<DeviceType> parseDeviceType(std::string_view text) noexcept;
[[nodiscard]] std::optional<HiddenAreaKind> parseHiddenAreaKind(std::string_view text) noexcept;

// Case-insensitive: accepts "quick", "Full", "ADVANCED".
[[nodiscard]] std::optional<EraseMode> parseEraseMode(std::string_view text) noexcept;

} // namespace wipecert::core

#endif // INCLUDE_WIPECERT_CORE_STORAGEDEVICE_HPP
