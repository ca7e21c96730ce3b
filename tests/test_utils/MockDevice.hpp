#ifndef WIPECERT_TESTS_TEST_UTILS_MOCKDEVICE_HPP
#define WIPECERT_TESTS_TEST_UTILS_MOCKDEVICE_HPP

#include "wipecert/device/IDeviceOperations.hpp"
#include "wipecert/device/IDeviceProbe.hpp"
#include <algorithm>
#include <cstdint>
#include <gmock/gmock.h>
#include <span>
#include <vector>

namespace wipecert::test_utils
{

class MockDeviceOperations : public wipecert::device::IDeviceOperations
{
public:
    MOCK_METHOD(std::uint64_t, overwrite,
                (const wipecert::core::StorageDevice& device, std::uint8_t pattern,
                 const wipecert::core::CancellationToken& token),
                (override));
    MOCK_METHOD(void, trim, (const wipecert::core::StorageDevice& device), (override));
    MOCK_METHOD(void, secureErase, (const wipecert::core::StorageDevice& device), (override));
    MOCK_METHOD(void, nvmeFormat, (const wipecert::core::StorageDevice& device, bool secure), (override));
    MOCK_METHOD(void, cryptoErase, (const wipecert::core::StorageDevice& device), (override));
    MOCK_METHOD(bool, readSector,
                (const wipecert::core::StorageDevice& device, std::uint64_t index, std::span<std::uint8_t> out),
                (override));
    MOCK_METHOD(void, exposeHiddenArea,
                (const wipecert::core::StorageDevice& device, const wipecert::core::HiddenArea& area), (override));
};

class MockDeviceProbe : public wipecert::device::IDeviceProbe
{
public:
    MOCK_METHOD(std::vector<wipecert::core::StorageDevice>, listDevices, (), (override));
};

// readSector action: fills the sector with `pattern` and reports a full read.
inline auto fillSector(std::uint8_t pattern)
{
    return [pattern](const wipecert::core::StorageDevice& /*device*/, std::uint64_t /*index*/,
                     std::span<std::uint8_t> out)
    {
        std::fill(out.begin(), out.end(), pattern);
        return true;
    };
}

} // namespace wipecert::test_utils

#endif // WIPECERT_TESTS_TEST_UTILS_MOCKDEVICE_HPP
