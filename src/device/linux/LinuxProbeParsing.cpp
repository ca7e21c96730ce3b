#include "wipecert/device/LinuxProbeParsing.hpp"
#include <cctype>
#include <charconv>
#include <string>

namespace wipecert::device::detail
{
namespace
{

[[nodiscard]] bool startsWith(std::string_view text, std::string_view prefix) noexcept
{
    return text.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] bool isDigits(std::string_view text) noexcept
{
    if (text.empty())
    {
        return false;
    }
    for (const char c : text)
    {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0)
        {
            return false;
        }
    }
    return true;
}

[[nodiscard]] std::string_view trim(std::string_view text) noexcept
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0)
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0)
    {
        text.remove_suffix(1);
    }
    return text;
}

[[nodiscard]] std::optional<std::uint64_t> parseU64(std::string_view text) noexcept
{
    std::uint64_t value{ 0U };
    const auto* end{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(text.data(), end, value) };
    if (ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

// Calls fn(line) for every line of `text`.
template <class Fn> void forEachLine(std::string_view text, Fn&& fn)
{
    while (!text.empty())
    {
        const auto eol{ text.find('\n') };
        const auto line{ text.substr(0, eol) };
        fn(line);
        if (eol == std::string_view::npos)
        {
            break;
        }
        text.remove_prefix(eol + 1U);
    }
}

} // namespace

bool isCandidateBlockDevice(std::string_view name) noexcept
{
    if (startsWith(name, "sd") || startsWith(name, "hd"))
    {
        // sda, sdab. Names with digits (partitions) are rejected.
        const auto suffix{ name.substr(2) };
        if (suffix.empty())
        {
            return false;
        }
        for (const char c : suffix)
        {
            if (c < 'a' || c > 'z')
            {
                return false;
            }
        }
        return true;
    }
    if (startsWith(name, "nvme"))
    {
        const auto rest{ name.substr(4) };
        const auto n{ rest.find('n') };
        if (n == std::string_view::npos)
        {
            return false;
        }
        return isDigits(rest.substr(0, n)) && isDigits(rest.substr(n + 1U));
    }
    if (startsWith(name, "mmcblk"))
    {
        return isDigits(name.substr(6));
    }
    return false;
}

wipecert::core::DeviceType classifyDevice(const SysfsFacts& facts) noexcept
{
    using wipecert::core::DeviceType;
    if (startsWith(facts.name, "nvme"))
    {
        return DeviceType::NVMe;
    }
    if (facts.usbTransport || facts.removable)
    {
        return DeviceType::USB;
    }
    if (startsWith(facts.name, "mmcblk"))
    {
        return DeviceType::SSD;
    }
    if (startsWith(facts.name, "sd") || startsWith(facts.name, "hd"))
    {
        return facts.rotational ? DeviceType::HDD : DeviceType::SSD;
    }
    return DeviceType::Unknown;
}

std::string interfaceTypeFor(const SysfsFacts& facts)
{
    if (startsWith(facts.name, "nvme"))
    {
        return "NVMe";
    }
    if (facts.usbTransport)
    {
        return "USB";
    }
    if (startsWith(facts.name, "mmcblk"))
    {
        return "MMC";
    }
    if (startsWith(facts.name, "hd"))
    {
        return "IDE";
    }
    return "SATA/SCSI";
}

HdparmIdentity parseHdparmIdentity(std::string_view text)
{
    HdparmIdentity out{};
    bool inSecurity{ false };
    forEachLine(text,
                [&out, &inSecurity](std::string_view raw)
                {
                    const auto line{ trim(raw) };
                    if (startsWith(line, "Model Number:"))
                    {
                        out.model = trimmedOrNull(line.substr(13));
                    }
                    else if (startsWith(line, "Serial Number:"))
                    {
                        out.serial = trimmedOrNull(line.substr(14));
                    }
                    else if (startsWith(line, "Firmware Revision:"))
                    {
                        out.firmware = trimmedOrNull(line.substr(18));
                    }
                    else if (startsWith(line, "Security:"))
                    {
                        inSecurity = true;
                    }
                    else if (inSecurity && !raw.empty() && std::isspace(static_cast<unsigned char>(raw.front())) == 0)
                    {
                        // Next unindented section header.
                        inSecurity = false;
                    }
                    else if (inSecurity && line == "supported")
                    {
                        out.securitySupported = true;
                    }
                });
    return out;
}

std::optional<NativeMaxSectors> parseHdparmNativeMax(std::string_view text)
{
    std::optional<NativeMaxSectors> out{};
    forEachLine(text,
                [&out](std::string_view raw)
                {
                    const auto line{ trim(raw) };
                    if (!startsWith(line, "max sectors"))
                    {
                        return;
                    }
                    const auto eq{ line.find('=') };
                    const auto slash{ line.find('/') };
                    const auto comma{ line.find(',') };
                    if (eq == std::string_view::npos || slash == std::string_view::npos || slash < eq)
                    {
                        return;
                    }
                    const auto current{ parseU64(trim(line.substr(eq + 1U, slash - eq - 1U))) };
                    const auto native{ parseU64(trim(line.substr(slash + 1U, comma == std::string_view::npos
                                                                                 ? std::string_view::npos
                                                                                 : comma - slash - 1U))) };
                    if (!current || !native)
                    {
                        return;
                    }
                    out = NativeMaxSectors{ .current = *current,
                                            .native = *native,
                                            .hpaEnabled = line.find("HPA is enabled") != std::string_view::npos };
                });
    return out;
}

std::optional<std::string> trimmedOrNull(std::string_view text)
{
    const auto t{ trim(text) };
    if (t.empty())
    {
        return std::nullopt;
    }
    return std::string{ t };
}

} // namespace wipecert::device::detail
