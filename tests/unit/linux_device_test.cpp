#include "test_utils/TestUtils.hpp"
#include "wipecert/device/DeviceErrors.hpp"
#include "wipecert/device/LinuxProbeParsing.hpp"
#include "wipecert/device/linux/LinuxDeviceFactory.hpp"
#include <gtest/gtest.h>
#include <system_error>
#include <vector>

namespace
{

namespace fs = std::filesystem;
using wipecert::core::DeviceType;
using wipecert::device::detail::SysfsFacts;

constexpr std::string_view g_kHdparmIdentity{ R"(
/dev/sda:

ATA device, with non-removable media
	Model Number:       WDC WD5000AAKX-00ERMA0
	Serial Number:      WD-WCC2EXAMPLE
	Firmware Revision:  15.01H15
Standards:
	Used: unknown (minor revision code 0x0029)
Security:
	Master password revision code = 65534
		supported
	not	enabled
	not	locked
	not	frozen
Logical Unit WWN Device Identifier: 50014ee0ae0e0e0e
)" };

constexpr std::string_view g_kHdparmNoSecurity{ R"(
ATA device, with non-removable media
	Model Number:       Example
Security:
	not	supported
Checksum: correct
)" };

void addBlockEntry(const fs::path& root, const std::string& name, std::uint64_t sectors, bool rotational,
                   bool removable, std::uint64_t discard)
{
    const auto entry{ root / name };
    wipecert::test_utils::writeTextFile(entry / "size", std::to_string(sectors) + "\n");
    wipecert::test_utils::writeTextFile(entry / "removable", removable ? "1\n" : "0\n");
    wipecert::test_utils::writeTextFile(entry / "queue" / "rotational", rotational ? "1\n" : "0\n");
    wipecert::test_utils::writeTextFile(entry / "queue" / "discard_granularity", std::to_string(discard) + "\n");
    wipecert::test_utils::writeTextFile(entry / "queue" / "logical_block_size", "512\n");
    wipecert::test_utils::writeTextFile(entry / "device" / "model", "Model " + name + "   \n");
}

} // namespace

TEST(LinuxProbeParsing, AcceptsWholeDisksOnly)
{
    using wipecert::device::detail::isCandidateBlockDevice;
    EXPECT_TRUE(isCandidateBlockDevice("sda"));
    EXPECT_TRUE(isCandidateBlockDevice("sdab"));
    EXPECT_TRUE(isCandidateBlockDevice("hdb"));
    EXPECT_TRUE(isCandidateBlockDevice("nvme0n1"));
    EXPECT_TRUE(isCandidateBlockDevice("mmcblk0"));

    EXPECT_FALSE(isCandidateBlockDevice("sda1"));
    EXPECT_FALSE(isCandidateBlockDevice("nvme0n1p2"));
    EXPECT_FALSE(isCandidateBlockDevice("mmcblk0boot0"));
    EXPECT_FALSE(isCandidateBlockDevice("loop0"));
    EXPECT_FALSE(isCandidateBlockDevice("dm-0"));
    EXPECT_FALSE(isCandidateBlockDevice("sd"));
}

TEST(LinuxProbeParsing, ClassifiesByNameTransportAndRotation)
{
    using wipecert::device::detail::classifyDevice;
    EXPECT_EQ(classifyDevice(SysfsFacts{ .name = "nvme0n1", .rotational = false }), DeviceType::NVMe);
    EXPECT_EQ(classifyDevice(SysfsFacts{ .name = "sda", .rotational = true }), DeviceType::HDD);
    EXPECT_EQ(classifyDevice(SysfsFacts{ .name = "sdb", .rotational = false }), DeviceType::SSD);
    EXPECT_EQ(classifyDevice(SysfsFacts{ .name = "sdc", .rotational = true, .usbTransport = true }), DeviceType::USB);
    EXPECT_EQ(classifyDevice(SysfsFacts{ .name = "sdd", .rotational = false, .removable = true }), DeviceType::USB);
    EXPECT_EQ(classifyDevice(SysfsFacts{ .name = "mmcblk0", .rotational = false }), DeviceType::SSD);
}

TEST(LinuxProbeParsing, InterfaceNames)
{
    using wipecert::device::detail::interfaceTypeFor;
    EXPECT_EQ(interfaceTypeFor(SysfsFacts{ .name = "nvme1n1" }), "NVMe");
    EXPECT_EQ(interfaceTypeFor(SysfsFacts{ .name = "sda", .usbTransport = true }), "USB");
    EXPECT_EQ(interfaceTypeFor(SysfsFacts{ .name = "mmcblk0" }), "MMC");
    EXPECT_EQ(interfaceTypeFor(SysfsFacts{ .name = "hda" }), "IDE");
    EXPECT_EQ(interfaceTypeFor(SysfsFacts{ .name = "sda" }), "SATA/SCSI");
}

TEST(LinuxProbeParsing, HdparmIdentityReadsFieldsAndSecurity)
{
    const auto identity{ wipecert::device::detail::parseHdparmIdentity(g_kHdparmIdentity) };
    EXPECT_EQ(identity.model, std::optional<std::string>{ "WDC WD5000AAKX-00ERMA0" });
    EXPECT_EQ(identity.serial, std::optional<std::string>{ "WD-WCC2EXAMPLE" });
    EXPECT_EQ(identity.firmware, std::optional<std::string>{ "15.01H15" });
    EXPECT_TRUE(identity.securitySupported);

    EXPECT_FALSE(wipecert::device::detail::parseHdparmIdentity(g_kHdparmNoSecurity).securitySupported);
}

TEST(LinuxProbeParsing, HdparmNativeMax)
{
    const auto enabled{ wipecert::device::detail::parseHdparmNativeMax(
        "\n/dev/sda:\n max sectors   = 976771055/976773168, HPA is enabled\n") };
    ASSERT_TRUE(enabled.has_value());
    EXPECT_EQ(enabled->current, 976771055U);
    EXPECT_EQ(enabled->native, 976773168U);
    EXPECT_TRUE(enabled->hpaEnabled);

    const auto disabled{ wipecert::device::detail::parseHdparmNativeMax(
        " max sectors   = 976773168/976773168, HPA is disabled\n") };
    ASSERT_TRUE(disabled.has_value());
    EXPECT_FALSE(disabled->hpaEnabled);

    EXPECT_FALSE(wipecert::device::detail::parseHdparmNativeMax("garbage").has_value());
}

TEST(LinuxDeviceProbe, ReadsFakeSysfsTree)
{
    const wipecert::test_utils::TempDir dir{ "probe_" };
    ASSERT_FALSE(dir.path().empty());
    const auto sysBlock{ dir.path() / "sys_block" };

    addBlockEntry(sysBlock, "sdb", 2048U, false, false, 4096U);
    addBlockEntry(sysBlock, "sda", 4096U, true, false, 0U);
    addBlockEntry(sysBlock, "nvme0n1", 8192U, false, false, 512U);
    addBlockEntry(sysBlock, "sda1", 1024U, true, false, 0U);
    addBlockEntry(sysBlock, "loop0", 1024U, false, false, 0U);
    addBlockEntry(sysBlock, "sdc", 0U, true, true, 0U);

    auto probe{ wipecert::device::makeLinuxDeviceProbe(wipecert::device::LinuxProbeOptions{
        .sysBlockRoot = sysBlock, .devRoot = "/dev", .queryHdparm = false }) };
    const auto devices{ probe->listDevices() };

    ASSERT_EQ(devices.size(), 3U);
    EXPECT_EQ(devices[0].name, "nvme0n1");
    EXPECT_EQ(devices[0].type, DeviceType::NVMe);
    EXPECT_TRUE(devices[0].supportsCryptoErase);

    EXPECT_EQ(devices[1].name, "sda");
    EXPECT_EQ(devices[1].path, "/dev/sda");
    EXPECT_EQ(devices[1].size, 4096U * 512U);
    EXPECT_EQ(devices[1].type, DeviceType::HDD);
    EXPECT_FALSE(devices[1].supportsTrim);
    EXPECT_EQ(devices[1].model, std::optional<std::string>{ "Model sda" });

    EXPECT_EQ(devices[2].name, "sdb");
    EXPECT_EQ(devices[2].type, DeviceType::SSD);
    EXPECT_TRUE(devices[2].supportsTrim);
    EXPECT_FALSE(devices[2].supportsSecureErase);
}

TEST(LinuxDeviceProbe, MissingSysfsRootThrows)
{
    auto probe{ wipecert::device::makeLinuxDeviceProbe(wipecert::device::LinuxProbeOptions{
        .sysBlockRoot = "/nonexistent/wipecert/sys/block", .devRoot = "/dev", .queryHdparm = false }) };
    EXPECT_THROW(static_cast<void>(probe->listDevices()), std::system_error);
}

TEST(LinuxDeviceOperations, OverwritesAndReadsBackAnImageFile)
{
    const wipecert::test_utils::TempDir dir{ "ops_" };
    ASSERT_FALSE(dir.path().empty());
    const auto image{ dir.path() / "disk.img" };
    constexpr std::size_t kImageBytes{ (3U * 1024U * 1024U) + 512U };
    wipecert::test_utils::writeTextFile(image, std::string(kImageBytes, 'x'));

    auto device{ wipecert::test_utils::makeDevice(DeviceType::Unknown, kImageBytes) };
    device.path = image.string();

    auto ops{ wipecert::device::makeLinuxDeviceOperations() };
    const wipecert::core::CancellationToken token{};
    EXPECT_EQ(ops->overwrite(device, 0xAAU, token), kImageBytes);

    std::vector<std::uint8_t> sector(device.sectorSize);
    ASSERT_TRUE(ops->readSector(device, device.sectorCount() - 1U, sector));
    for (const auto b : sector)
    {
        ASSERT_EQ(b, 0xAAU);
    }
    EXPECT_FALSE(ops->readSector(device, device.sectorCount(), sector));
}

TEST(LinuxDeviceOperations, CancelledTokenStopsOverwrite)
{
    const wipecert::test_utils::TempDir dir{ "ops_" };
    ASSERT_FALSE(dir.path().empty());
    const auto image{ dir.path() / "disk.img" };
    wipecert::test_utils::writeTextFile(image, std::string(4096U, 'x'));

    auto device{ wipecert::test_utils::makeDevice(DeviceType::Unknown, 4096U) };
    device.path = image.string();

    auto ops{ wipecert::device::makeLinuxDeviceOperations() };
    wipecert::core::CancellationToken token{};
    token.cancel();
    EXPECT_THROW(static_cast<void>(ops->overwrite(device, 0x00U, token)), wipecert::core::OperationCancelled);
}

TEST(LinuxDeviceOperations, ErrorsAreTyped)
{
    const wipecert::test_utils::TempDir dir{ "ops_" };
    ASSERT_FALSE(dir.path().empty());
    auto ops{ wipecert::device::makeLinuxDeviceOperations() };
    const wipecert::core::CancellationToken token{};

    auto missing{ wipecert::test_utils::makeDevice(DeviceType::HDD, 4096U) };
    missing.path = (dir.path() / "absent").string();
    EXPECT_THROW(static_cast<void>(ops->overwrite(missing, 0x00U, token)), wipecert::device::DeviceNotFound);

    auto plain{ wipecert::test_utils::makeDevice(DeviceType::SSD, 4096U) };
    plain.path = (dir.path() / "plain.img").string();
    wipecert::test_utils::writeTextFile(plain.path, std::string(4096U, 'x'));
    EXPECT_THROW(ops->trim(plain), std::system_error);

    plain.supportsSecureErase = false;
    EXPECT_THROW(ops->secureErase(plain), wipecert::device::SecureEraseNotSupported);

    const wipecert::core::HiddenArea reserved{ .kind = wipecert::core::HiddenAreaKind::SSDReserved,
                                               .startLba = 0U,
                                               .size = 1U,
                                               .description = "Reserved" };
    EXPECT_THROW(ops->exposeHiddenArea(plain, reserved), wipecert::device::HiddenAreaAccessFailed);
}
