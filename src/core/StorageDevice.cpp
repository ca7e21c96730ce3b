#include "wipecert/core/StorageDevice.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace wipecert::core
{
namespace
{

constexpr std::array<std::pair<DeviceType, std::string_view>, 5> g_kDeviceTypeNames{ {
    { DeviceType::HDD, "HDD" },
    { DeviceType::SSD, "SSD" },
    { DeviceType::NVMe, "NVMe" },
    { DeviceType::USB, "USB" },
    { DeviceType::Unknown, "Unknown" },
} };

constexpr std::array<std::pair<EraseMode, std::string_view>, 3> g_kEraseModeNames{ {
    { EraseMode::Quick, "Quick" },
    { EraseMode::Full, "Full" },
    { EraseMode::Advanced, "Advanced" },
} };

constexpr std::array<std::pair<HiddenAreaKind, std::string_view>, 4> g_kHiddenAreaNames{ {
    { HiddenAreaKind::HPA, "HPA" },
    { HiddenAreaKind::DCO, "DCO" },
    { HiddenAreaKind::SSDReserved, "SSDReserved" },
    { HiddenAreaKind::VendorSpecific, "VendorSpecific" },
} };

template <class Enum, std::size_t N>
[[nodiscard]] std::string_view nameOf(const std::array<std::pair<Enum, std::string_view>, N>& names,
                                      Enum value) noexcept
{
    for (const auto& [e, name] : names)
    {
        if (e == value)
        {
            return name;
        }
    }
    return "Unknown";
}

template <class Enum, std::size_t N>
[[nodiscard]] std::optional<Enum> valueOf(const std::array<std::pair<Enum, std::string_view>, N>& names,
                                          std::string_view text) noexcept
{
    for (const auto& [e, name] : names)
    {
        if (name == text)
        {
            return e;
        }
    }
    return std::nullopt;
}

[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(),
                                              [](char x, char y)
                                              {
                                                  return std::tolower(static_cast<unsigned char>(x)) ==
                                                         std::tolower(static_cast<unsigned char>(y));
                                              });
}

} // namespace

std::string_view toString(DeviceType type) noexcept
{
    return nameOf(g_kDeviceTypeNames, type);
}

std::string_view toString(EraseMode mode) noexcept
{
    return nameOf(g_kEraseModeNames, mode);
}

std::string_view toString(HiddenAreaKind kind) noexcept
{
    return nameOf(g_kHiddenAreaNames, kind);
}

std::optional<DeviceType> parseDeviceType(std::string_view text) noexcept
{
    return valueOf(g_kDeviceTypeNames, text);
}

std::optional<HiddenAreaKind> parseHiddenAreaKind(std::string_view text) noexcept
{
    return valueOf(g_kHiddenAreaNames, text);
}

std::optional<EraseMode> parseEraseMode(std::string_view text) noexcept
{
    for (const auto& [mode, name] : g_kEraseModeNames)
    {
        if (equalsIgnoreCase(name, text))
        {
            return mode;
        }
    }
    return std::nullopt;
}

} // namespace wipecert::core
