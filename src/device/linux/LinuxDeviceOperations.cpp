#include "Process.hpp"
#include "wipecert/device/DeviceErrors.hpp"
#include "wipecert/device/linux/LinuxDeviceFactory.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <fcntl.h>
#include <glog/logging.h>
#include <linux/fs.h>
#include <linux/nvme_ioctl.h>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace wipecert::device
{
namespace
{

using wipecert::core::CancellationToken;
using wipecert::core::StorageDevice;

constexpr std::size_t g_kChunkBytes{ 1024U * 1024U };
constexpr std::uint64_t g_kDiscardRangeBytes{ 1024ULL * 1024ULL * 1024ULL };

constexpr std::uint8_t g_kNvmeAdminIdentify{ 0x06U };
constexpr std::uint8_t g_kNvmeAdminFormatNvm{ 0x80U };
constexpr std::uint32_t g_kNvmeIdentifyNamespace{ 0x00U };
constexpr std::size_t g_kNvmeIdentifyBytes{ 4096U };
constexpr std::size_t g_kNvmeFlbasOffset{ 26U };
constexpr std::uint32_t g_kNvmeSesUserData{ 1U };
constexpr std::uint32_t g_kNvmeSesCrypto{ 2U };
constexpr std::uint32_t g_kNvmeSesShift{ 9U };
constexpr std::uint32_t g_kNvmeFormatTimeoutMs{ 0U }; // kernel default

// ATA security password used only for the duration of one erase.
constexpr const char* g_kAtaPassword{ "wipecert" };

[[noreturn]] void throwOpenError(int err, const std::string& path)
{
    if (err == ENOENT || err == ENXIO || err == ENODEV)
    {
        throw DeviceNotFound{ "Device not found: " + path };
    }
    if (err == EACCES || err == EPERM)
    {
        throw PermissionDenied{ "Permission denied: " + path };
    }
    throw std::system_error{ err, std::generic_category(), "open " + path };
}

class FileDescriptor final
{
public:
    FileDescriptor(const std::string& path, int flags) : m_fd{ ::open(path.c_str(), flags | O_CLOEXEC) }
    {
        if (m_fd < 0)
        {
            throwOpenError(errno, path);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&&) = delete;
    FileDescriptor& operator=(FileDescriptor&&) = delete;
    ~FileDescriptor()
    {
        if (m_fd >= 0)
        {
            ::close(m_fd);
        }
    }

    [[nodiscard]] int get() const noexcept
    {
        return m_fd;
    }

private:
    int m_fd{ -1 };
};

[[nodiscard]] bool isBlockDevice(int fd)
{
    struct stat st{};
    if (::fstat(fd, &st) != 0)
    {
        throw std::system_error{ errno, std::generic_category(), "fstat" };
    }
    return S_ISBLK(st.st_mode);
}

[[nodiscard]] std::uint64_t addressableBytes(int fd)
{
    struct stat st{};
    if (::fstat(fd, &st) != 0)
    {
        throw std::system_error{ errno, std::generic_category(), "fstat" };
    }
    if (!S_ISBLK(st.st_mode))
    {
        return static_cast<std::uint64_t>(st.st_size);
    }
    std::uint64_t size{ 0U };
    if (::ioctl(fd, BLKGETSIZE64, &size) != 0)
    {
        throw std::system_error{ errno, std::generic_category(), "BLKGETSIZE64" };
    }
    return size;
}

void requireWritable(int fd, const std::string& path)
{
    if (!isBlockDevice(fd))
    {
        return;
    }
    int readOnly{ 0 };
    if (::ioctl(fd, BLKROGET, &readOnly) == 0 && readOnly != 0)
    {
        throw PermissionDenied{ "Device is read-only: " + path };
    }
}

void pwriteAll(int fd, const std::uint8_t* data, std::size_t size, std::uint64_t offset)
{
    while (size > 0U)
    {
        const ssize_t n{ ::pwrite(fd, data, size, static_cast<off_t>(offset)) };
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw std::system_error{ errno, std::generic_category(),
                                     "pwrite at offset " + std::to_string(offset) };
        }
        if (n == 0)
        {
            throw std::system_error{ ENOSPC, std::generic_category(),
                                     "short write at offset " + std::to_string(offset) };
        }
        data += n;
        size -= static_cast<std::size_t>(n);
        offset += static_cast<std::uint64_t>(n);
    }
}

// Returns the number of bytes read; less than `size` only at end of device.
[[nodiscard]] std::size_t preadAll(int fd, std::uint8_t* data, std::size_t size, std::uint64_t offset)
{
    std::size_t total{ 0U };
    while (total < size)
    {
        const ssize_t n{ ::pread(fd, data + total, size - total, static_cast<off_t>(offset + total)) };
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw std::system_error{ errno, std::generic_category(),
                                     "pread at offset " + std::to_string(offset) };
        }
        if (n == 0)
        {
            break;
        }
        total += static_cast<std::size_t>(n);
    }
    return total;
}

void runChecked(const std::vector<std::string>& args, const std::string& what)
{
    const auto result{ detail::runProcess(args) };
    if (result.exitCode != 0)
    {
        throw std::runtime_error{ what + " (exit " + std::to_string(result.exitCode) + "): " + result.output };
    }
}

[[nodiscard]] std::uint32_t nvmeNamespaceId(int fd)
{
    const int nsid{ ::ioctl(fd, NVME_IOCTL_ID) };
    if (nsid <= 0)
    {
        throw std::system_error{ errno, std::generic_category(), "NVME_IOCTL_ID" };
    }
    return static_cast<std::uint32_t>(nsid);
}

// Current LBA format index, so a format keeps the sector size.
[[nodiscard]] std::uint32_t nvmeCurrentLbaFormat(int fd, std::uint32_t nsid)
{
    std::vector<std::uint8_t> identify(g_kNvmeIdentifyBytes, 0U);
    nvme_admin_cmd cmd{};
    cmd.opcode = g_kNvmeAdminIdentify;
    cmd.nsid = nsid;
    cmd.addr = reinterpret_cast<std::uintptr_t>(identify.data());
    cmd.data_len = static_cast<std::uint32_t>(identify.size());
    cmd.cdw10 = g_kNvmeIdentifyNamespace;
    if (::ioctl(fd, NVME_IOCTL_ADMIN_CMD, &cmd) != 0)
    {
        throw std::system_error{ errno, std::generic_category(), "NVMe identify namespace" };
    }
    return identify[g_kNvmeFlbasOffset] & 0x0FU;
}

void nvmeFormatNvm(const StorageDevice& device, std::uint32_t ses)
{
    const FileDescriptor fd{ device.path, O_RDONLY };
    const auto nsid{ nvmeNamespaceId(fd.get()) };
    const auto lbaf{ nvmeCurrentLbaFormat(fd.get(), nsid) };

    nvme_admin_cmd cmd{};
    cmd.opcode = g_kNvmeAdminFormatNvm;
    cmd.nsid = nsid;
    cmd.cdw10 = lbaf | (ses << g_kNvmeSesShift);
    cmd.timeout_ms = g_kNvmeFormatTimeoutMs;
    LOG(INFO) << "NVMe Format NVM on " << device.path << " (nsid " << nsid << ", SES " << ses << ")";
    if (::ioctl(fd.get(), NVME_IOCTL_ADMIN_CMD, &cmd) != 0)
    {
        throw std::system_error{ errno, std::generic_category(), "NVMe Format NVM on " + device.path };
    }
}

class LinuxDeviceOperations final : public IDeviceOperations
{
public:
    std::uint64_t overwrite(const StorageDevice& device, std::uint8_t pattern, const CancellationToken& token) override
    {
        const FileDescriptor fd{ device.path, O_WRONLY };
        requireWritable(fd.get(), device.path);
        const auto total{ addressableBytes(fd.get()) };

        const std::vector<std::uint8_t> buffer(g_kChunkBytes, pattern);
        std::uint64_t offset{ 0U };
        while (offset < total)
        {
            token.throwIfCancelled();
            const auto n{ static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), total - offset)) };
            pwriteAll(fd.get(), buffer.data(), n, offset);
            offset += n;
        }

        if (::fdatasync(fd.get()) != 0)
        {
            throw std::system_error{ errno, std::generic_category(), "fdatasync " + device.path };
        }
        VLOG(1) << "Wrote " << offset << " bytes of 0x" << std::hex << static_cast<unsigned>(pattern) << std::dec
                << " to " << device.path;
        return offset;
    }

    void trim(const StorageDevice& device) override
    {
        const FileDescriptor fd{ device.path, O_WRONLY };
        if (!isBlockDevice(fd.get()))
        {
            throw std::system_error{ ENOTBLK, std::generic_category(), "BLKDISCARD " + device.path };
        }
        const auto total{ addressableBytes(fd.get()) };
        for (std::uint64_t offset{ 0U }; offset < total; offset += g_kDiscardRangeBytes)
        {
            std::array<std::uint64_t, 2> range{ offset, std::min(g_kDiscardRangeBytes, total - offset) };
            if (::ioctl(fd.get(), BLKDISCARD, range.data()) != 0)
            {
                throw std::system_error{ errno, std::generic_category(),
                                         "BLKDISCARD at offset " + std::to_string(offset) };
            }
        }
        VLOG(1) << "Discarded " << total << " bytes on " << device.path;
    }

    void secureErase(const StorageDevice& device) override
    {
        if (!device.supportsSecureErase)
        {
            throw SecureEraseNotSupported{ "ATA security feature set not available on " + device.path };
        }
        runChecked({ "hdparm", "--user-master", "u", "--security-set-pass", g_kAtaPassword, device.path },
                   "hdparm --security-set-pass");
        runChecked({ "hdparm", "--user-master", "u", "--security-erase", g_kAtaPassword, device.path },
                   "hdparm --security-erase");
    }

    void nvmeFormat(const StorageDevice& device, bool secure) override
    {
        nvmeFormatNvm(device, secure ? g_kNvmeSesUserData : 0U);
    }

    void cryptoErase(const StorageDevice& device) override
    {
        if (!device.supportsCryptoErase)
        {
            throw SecureEraseNotSupported{ "Cryptographic erase not available on " + device.path };
        }
        nvmeFormatNvm(device, g_kNvmeSesCrypto);
    }

    [[nodiscard]] bool readSector(const StorageDevice& device, std::uint64_t index,
                                  std::span<std::uint8_t> out) override
    {
        const FileDescriptor fd{ device.path, O_RDONLY };
        const auto offset{ index * static_cast<std::uint64_t>(device.sectorSize) };
        return preadAll(fd.get(), out.data(), out.size(), offset) == out.size();
    }

    void exposeHiddenArea(const StorageDevice& device, const wipecert::core::HiddenArea& area) override
    {
        try
        {
            switch (area.kind)
            {
            case wipecert::core::HiddenAreaKind::HPA:
                runChecked({ "hdparm", "--yes-i-know-what-i-am-doing", "-N",
                             "p" + std::to_string(area.startLba + area.size), device.path },
                           "hdparm -N");
                return;
            case wipecert::core::HiddenAreaKind::DCO:
                runChecked({ "hdparm", "--yes-i-know-what-i-am-doing", "--dco-restore", device.path },
                           "hdparm --dco-restore");
                return;
            case wipecert::core::HiddenAreaKind::SSDReserved:
            case wipecert::core::HiddenAreaKind::VendorSpecific:
                break;
            }
        }
        catch (const std::exception& e)
        {
            throw HiddenAreaAccessFailed{ e.what() };
        }
        throw HiddenAreaAccessFailed{ std::string{ wipecert::core::toString(area.kind) } +
                                      " areas are only reachable through a firmware erase" };
    }
};

} // namespace

std::unique_ptr<IDeviceOperations> makeLinuxDeviceOperations()
{
    return std::make_unique<LinuxDeviceOperations>();
}

} // namespace wipecert::device
