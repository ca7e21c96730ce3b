#include "Process.hpp"
#include "wipecert/device/LinuxProbeParsing.hpp"
#include "wipecert/device/linux/LinuxDeviceFactory.hpp"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <glog/logging.h>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace wipecert::device
{
namespace
{

namespace fs = std::filesystem;

constexpr std::uint64_t g_kSysfsSectorBytes{ 512U };

[[nodiscard]] std::optional<std::string> readAttribute(const fs::path& path)
{
    std::ifstream in{ path };
    if (!in)
    {
        return std::nullopt;
    }
    std::string value{};
    std::getline(in, value);
    return detail::trimmedOrNull(value);
}

[[nodiscard]] std::uint64_t readNumber(const fs::path& path, std::uint64_t fallback)
{
    const auto text{ readAttribute(path) };
    if (!text)
    {
        return fallback;
    }
    try
    {
        return std::stoull(*text);
    }
    catch (const std::exception&)
    {
        return fallback;
    }
}

[[nodiscard]] bool isUsbAttached(const fs::path& entry)
{
    std::error_code ec{};
    const auto resolved{ fs::canonical(entry / "device", ec) };
    if (ec)
    {
        return false;
    }
    return resolved.string().find("/usb") != std::string::npos;
}

class LinuxDeviceProbe final : public IDeviceProbe
{
public:
    explicit LinuxDeviceProbe(LinuxProbeOptions options) : m_options{ std::move(options) }
    {
    }

    [[nodiscard]] std::vector<wipecert::core::StorageDevice> listDevices() override
    {
        std::error_code ec{};
        fs::directory_iterator it{ m_options.sysBlockRoot, ec };
        if (ec)
        {
            throw std::system_error{ ec, "listDevices: " + m_options.sysBlockRoot.string() };
        }

        std::vector<wipecert::core::StorageDevice> devices{};
        for (const auto& entry : it)
        {
            const auto name{ entry.path().filename().string() };
            if (!detail::isCandidateBlockDevice(name))
            {
                continue;
            }
            auto device{ describe(entry.path(), name) };
            if (device.size == 0U)
            {
                VLOG(1) << "Skipping empty block device " << name;
                continue;
            }
            devices.push_back(std::move(device));
        }

        std::sort(devices.begin(), devices.end(),
                  [](const auto& a, const auto& b) { return a.name < b.name; });
        LOG(INFO) << "Found " << devices.size() << " storage device(s)";
        return devices;
    }

private:
    [[nodiscard]] wipecert::core::StorageDevice describe(const fs::path& entry, const std::string& name) const
    {
        detail::SysfsFacts facts{};
        facts.name = name;
        facts.rotational = readNumber(entry / "queue" / "rotational", 1U) != 0U;
        facts.removable = readNumber(entry / "removable", 0U) != 0U;
        facts.usbTransport = isUsbAttached(entry);
        facts.discardGranularity = readNumber(entry / "queue" / "discard_granularity", 0U);

        wipecert::core::StorageDevice device{};
        device.path = (m_options.devRoot / name).string();
        device.name = name;
        device.size = readNumber(entry / "size", 0U) * g_kSysfsSectorBytes;
        device.type = detail::classifyDevice(facts);
        device.interfaceType = detail::interfaceTypeFor(facts);
        device.model = readAttribute(entry / "device" / "model");
        device.serial = readAttribute(entry / "device" / "serial");
        device.firmwareVersion = readAttribute(entry / "device" / "firmware_rev");
        if (!device.firmwareVersion)
        {
            device.firmwareVersion = readAttribute(entry / "device" / "rev");
        }
        device.supportsTrim = facts.discardGranularity > 0U;
        device.supportsCryptoErase = device.type == wipecert::core::DeviceType::NVMe;
        device.sectorSize = static_cast<std::uint32_t>(
            readNumber(entry / "queue" / "logical_block_size", wipecert::core::g_defaultSectorSize));
        if (device.sectorSize == 0U)
        {
            device.sectorSize = wipecert::core::g_defaultSectorSize;
        }

        const bool ataStyle{ device.type == wipecert::core::DeviceType::HDD ||
                             device.type == wipecert::core::DeviceType::SSD };
        if (m_options.queryHdparm && ataStyle && name.rfind("mmcblk", 0) != 0)
        {
            queryHdparm(device);
        }
        return device;
    }

    // Best effort: a missing hdparm or a non-ATA bridge leaves the sysfs facts untouched.
    void queryHdparm(wipecert::core::StorageDevice& device) const
    {
        try
        {
            const auto identity{ detail::runProcess({ "hdparm", "-I", device.path }) };
            if (identity.exitCode == 0)
            {
                const auto parsed{ detail::parseHdparmIdentity(identity.output) };
                if (parsed.model)
                {
                    device.model = parsed.model;
                }
                if (parsed.serial)
                {
                    device.serial = parsed.serial;
                }
                if (parsed.firmware)
                {
                    device.firmwareVersion = parsed.firmware;
                }
                device.supportsSecureErase = parsed.securitySupported;
            }

            const auto nativeMax{ detail::runProcess({ "hdparm", "-N", device.path }) };
            if (nativeMax.exitCode == 0)
            {
                const auto parsed{ detail::parseHdparmNativeMax(nativeMax.output) };
                if (parsed && parsed->hpaEnabled && parsed->native > parsed->current)
                {
                    device.hiddenAreas.push_back(wipecert::core::HiddenArea{
                        .kind = wipecert::core::HiddenAreaKind::HPA,
                        .startLba = parsed->current,
                        .size = parsed->native - parsed->current,
                        .description = "Host Protected Area",
                    });
                }
            }
        }
        catch (const std::system_error& e)
        {
            LOG(WARNING) << "hdparm unavailable for " << device.path << ": " << e.what();
        }
    }

    LinuxProbeOptions m_options;
};

} // namespace

std::unique_ptr<IDeviceProbe> makeLinuxDeviceProbe(LinuxProbeOptions options)
{
    return std::make_unique<LinuxDeviceProbe>(std::move(options));
}

} // namespace wipecert::device
