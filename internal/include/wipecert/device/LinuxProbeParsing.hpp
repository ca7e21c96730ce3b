#ifndef INCLUDE_WIPECERT_DEVICE_LINUXPROBEPARSING_HPP
#define INCLUDE_WIPECERT_DEVICE_LINUXPROBEPARSING_HPP

#include "wipecert/core/StorageDevice.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wipecert::device::detail
{

// Raw facts gathered from /sys/block/<name>.
struct SysfsFacts final
{
    std::string name;
    bool rotational{ true };
    bool removable{ false };
    bool usbTransport{ false };
    std::uint64_t discardGranularity{ 0U };
};

struct HdparmIdentity final
{
    std::optional<std::string> model;
    std::optional<std::string> serial;
    std::optional<std::string> firmware;
    bool securitySupported{ false };
};

struct NativeMaxSectors final
{
    std::uint64_t current{ 0U };
    std::uint64_t native{ 0U };
    bool hpaEnabled{ false };
};

// sd*, hd*, nvme<c>n<ns> and mmcblk<n> (partitions, boot and rpmb areas excluded).
[[nodiscard]] bool isCandidateBlockDevice(std::string_view name) noexcept;

[[nodiscard]] wipecert::core::DeviceType classifyDevice(const SysfsFacts& facts) noexcept;

[[nodiscard]] std::string interfaceTypeFor(const SysfsFacts& facts);

// Parses `hdparm -I` output.
[[nodiscard]] HdparmIdentity parseHdparmIdentity(std::string_view text);

// Parses `hdparm -N` output ("max sectors   = 976771055/976773168, HPA is enabled").
[[nodiscard]] std::optional<NativeMaxSectors> parseHdparmNativeMax(std::string_view text);

// Strips surrounding whitespace; std::nullopt for an empty result.
[[nodiscard]] std::optional<std::string> trimmedOrNull(std::string_view text);

} // namespace wipecert::device::detail

#endif // INCLUDE_WIPECERT_DEVICE_LINUXPROBEPARSING_HPP
