#include "test_utils/MockDevice.hpp"
#include "test_utils/TestUtils.hpp"
#include "wipecert/core/WipeEngine.hpp"
#include "wipecert/device/DeviceErrors.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <variant>

namespace
{

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using wipecert::core::DeviceType;
using wipecert::core::EraseMode;
using wipecert::core::ErrorKind;
using wipecert::core::Failure;
using wipecert::core::WipeResult;
using wipecert::test_utils::MockDeviceOperations;

class WipeEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ON_CALL(m_ops, overwrite(_, _, _)).WillByDefault(Return(0U));
        ON_CALL(m_ops, readSector(_, _, _)).WillByDefault(Invoke(wipecert::test_utils::fillSector(0x00U)));
    }

    [[nodiscard]] wipecert::core::WipeEngine makeEngine(wipecert::core::WipeEngineConfig config = {})
    {
        return wipecert::core::WipeEngine{
            m_ops, config, [this]() { return m_clock++; },
            [this](std::chrono::milliseconds, const wipecert::core::CancellationToken&)
            {
                ++m_sleeps;
                return true;
            }
        };
    }

    NiceMock<MockDeviceOperations> m_ops;    // NOLINT
    std::uint64_t m_clock{ 1000U };          // NOLINT
    int m_sleeps{ 0 };                       // NOLINT
};

} // namespace

TEST_F(WipeEngineTest, SuccessfulQuickWipeOfHdd)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    EXPECT_CALL(m_ops, overwrite(_, 0x00U, _)).Times(1);

    auto engine{ makeEngine() };
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<WipeResult>(out));
    const auto& result{ std::get<WipeResult>(out) };

    EXPECT_TRUE(result.verificationPassed);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.bytesWritten, device.size);
    EXPECT_EQ(result.attempts, 1U);
    EXPECT_EQ(result.passesCompleted, 1U);
    EXPECT_EQ(result.sampleCount, 100U);
    EXPECT_DOUBLE_EQ(result.verificationRatio, 1.0);
    EXPECT_GE(result.endTime, result.startTime);
    EXPECT_EQ(result.durationSeconds, result.endTime - result.startTime);
    EXPECT_TRUE(result.capabilitiesUsed.empty());
    EXPECT_EQ(m_sleeps, 0);
}

TEST_F(WipeEngineTest, FullWipeRunsEveryCyclePass)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    {
        ::testing::InSequence seq;
        EXPECT_CALL(m_ops, overwrite(_, 0x00U, _));
        EXPECT_CALL(m_ops, overwrite(_, 0xFFU, _));
        EXPECT_CALL(m_ops, overwrite(_, 0xAAU, _));
        EXPECT_CALL(m_ops, overwrite(_, 0x00U, _));
    }

    auto engine{ makeEngine() };
    const auto out{ engine.erase(device, EraseMode::Full) };
    ASSERT_TRUE(std::holds_alternative<WipeResult>(out));
    EXPECT_EQ(std::get<WipeResult>(out).passesCompleted, 4U);
}

TEST_F(WipeEngineTest, RetriesThenSucceedsKeepingOneErrorPerFailedAttempt)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    EXPECT_CALL(m_ops, overwrite(_, _, _))
        .WillOnce(Throw(std::runtime_error{ "io error" }))
        .WillOnce(Throw(std::runtime_error{ "io error" }))
        .WillOnce(Return(device.size));

    auto engine{ makeEngine() };
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<WipeResult>(out));
    const auto& result{ std::get<WipeResult>(out) };
    ASSERT_EQ(result.errors.size(), 2U);
    EXPECT_EQ(result.errors[0], "Attempt 1 failed: io error");
    EXPECT_EQ(result.errors[1], "Attempt 2 failed: io error");
    EXPECT_EQ(result.attempts, 3U);
    EXPECT_EQ(m_sleeps, 2);
}

TEST_F(WipeEngineTest, ExhaustedRetriesReturnWipeFailed)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    EXPECT_CALL(m_ops, overwrite(_, _, _)).Times(3).WillRepeatedly(Throw(std::runtime_error{ "dead" }));
    EXPECT_CALL(m_ops, readSector(_, _, _)).Times(0);

    auto engine{ makeEngine() };
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<Failure>(out));
    const auto& failure{ std::get<Failure>(out) };
    EXPECT_EQ(failure.kind, ErrorKind::WipeFailed);
    EXPECT_EQ(failure.summary, "All 3 wipe attempts failed");
    ASSERT_EQ(failure.messages.size(), 3U);
    EXPECT_EQ(failure.messages[2], "Attempt 3 failed: dead");
    // No wait after the last attempt.
    EXPECT_EQ(m_sleeps, 2);
}

TEST_F(WipeEngineTest, MaxRetriesBelowOneStillMakesOneAttempt)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    EXPECT_CALL(m_ops, overwrite(_, _, _)).Times(1).WillOnce(Throw(std::runtime_error{ "dead" }));

    auto engine{ makeEngine(wipecert::core::WipeEngineConfig{ .maxRetries = 0U }) };
    EXPECT_EQ(engine.config().maxRetries, 1U);
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<Failure>(out));
    EXPECT_EQ(std::get<Failure>(out).messages.size(), 1U);
}

TEST_F(WipeEngineTest, NinetyFivePercentPassesVerification)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    int reads{ 0 };
    ON_CALL(m_ops, readSector(_, _, _))
        .WillByDefault(Invoke(
            [&reads](const wipecert::core::StorageDevice& d, std::uint64_t i, std::span<std::uint8_t> out)
            { return wipecert::test_utils::fillSector(reads++ < 95 ? 0x00U : 0x5AU)(d, i, out); }));

    auto engine{ makeEngine() };
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<WipeResult>(out));
    const auto& result{ std::get<WipeResult>(out) };
    EXPECT_EQ(result.verifiedSamples, 95U);
    EXPECT_TRUE(result.verificationPassed);
    EXPECT_DOUBLE_EQ(result.verificationRatio, 0.95);
}

TEST_F(WipeEngineTest, JustBelowThresholdFailsVerification)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    int reads{ 0 };
    ON_CALL(m_ops, readSector(_, _, _))
        .WillByDefault(Invoke(
            [&reads](const wipecert::core::StorageDevice& d, std::uint64_t i, std::span<std::uint8_t> out)
            { return wipecert::test_utils::fillSector(reads++ < 9499 ? 0x00U : 0x5AU)(d, i, out); }));

    auto engine{ makeEngine(wipecert::core::WipeEngineConfig{ .sampleCount = 10000U }) };
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<WipeResult>(out));
    const auto& result{ std::get<WipeResult>(out) };
    EXPECT_EQ(result.verifiedSamples, 9499U);
    EXPECT_FALSE(result.verificationPassed);
}

TEST(VerificationThreshold, IsInclusive)
{
    EXPECT_TRUE(wipecert::core::meetsVerificationThreshold(95U, 100U, 0.95));
    EXPECT_FALSE(wipecert::core::meetsVerificationThreshold(9499U, 10000U, 0.95));
    EXPECT_FALSE(wipecert::core::meetsVerificationThreshold(0U, 0U, 0.95));
}

TEST_F(WipeEngineTest, UnreadableSectorsCountAsUnverified)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    EXPECT_CALL(m_ops, readSector(_, _, _)).WillRepeatedly(Throw(std::runtime_error{ "EIO" }));

    auto engine{ makeEngine() };
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<WipeResult>(out));
    EXPECT_EQ(std::get<WipeResult>(out).verifiedSamples, 0U);
    EXPECT_FALSE(std::get<WipeResult>(out).verificationPassed);
}

TEST_F(WipeEngineTest, FirmwarePlansAcceptFfFilledSectors)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::NVMe) };
    EXPECT_CALL(m_ops, nvmeFormat(_, true)).Times(1);
    ON_CALL(m_ops, readSector(_, _, _)).WillByDefault(Invoke(wipecert::test_utils::fillSector(0xFFU)));

    auto engine{ makeEngine() };
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<WipeResult>(out));
    const auto& result{ std::get<WipeResult>(out) };
    EXPECT_TRUE(result.verificationPassed);
    EXPECT_EQ(result.capabilitiesUsed, (std::vector<wipecert::core::StepKind>{ wipecert::core::StepKind::NvmeFormat }));
}

TEST_F(WipeEngineTest, ZeroSizedDeviceFailsVerificationWithoutReading)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD, 0U) };
    EXPECT_CALL(m_ops, readSector(_, _, _)).Times(0);

    auto engine{ makeEngine() };
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<WipeResult>(out));
    const auto& result{ std::get<WipeResult>(out) };
    EXPECT_FALSE(result.verificationPassed);
    ASSERT_FALSE(result.errors.empty());
    EXPECT_THAT(result.errors.back(), HasSubstr("no addressable sectors"));
}

TEST_F(WipeEngineTest, HiddenAreasAreExposedBeforeErasing)
{
    auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    device.hiddenAreas.push_back(wipecert::core::HiddenArea{ .kind = wipecert::core::HiddenAreaKind::HPA,
                                                             .startLba = 100U,
                                                             .size = 50U,
                                                             .description = "Host Protected Area" });
    device.hiddenAreas.push_back(wipecert::core::HiddenArea{ .kind = wipecert::core::HiddenAreaKind::DCO,
                                                             .startLba = 150U,
                                                             .size = 10U,
                                                             .description = "Device Configuration Overlay" });
    {
        ::testing::InSequence seq;
        EXPECT_CALL(m_ops, exposeHiddenArea(_, ::testing::Field(&wipecert::core::HiddenArea::kind,
                                                                wipecert::core::HiddenAreaKind::HPA)));
        EXPECT_CALL(m_ops, exposeHiddenArea(_, ::testing::Field(&wipecert::core::HiddenArea::kind,
                                                                wipecert::core::HiddenAreaKind::DCO)))
            .WillOnce(Throw(wipecert::device::HiddenAreaAccessFailed{ "frozen" }));
        EXPECT_CALL(m_ops, overwrite(_, 0x00U, _));
    }

    auto engine{ makeEngine() };
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<WipeResult>(out));
    const auto& result{ std::get<WipeResult>(out) };
    EXPECT_EQ(result.hiddenAreasCleared, (std::vector<bool>{ true, false }));
    ASSERT_EQ(result.errors.size(), 1U);
    EXPECT_EQ(result.errors[0], "Hidden area Device Configuration Overlay could not be exposed: frozen");
}

TEST_F(WipeEngineTest, CancelledBeforeStartReturnsCancelled)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    EXPECT_CALL(m_ops, overwrite(_, _, _)).Times(0);

    wipecert::core::CancellationToken token{};
    token.cancel();
    auto engine{ makeEngine() };
    const auto out{ engine.erase(device, EraseMode::Quick, token) };
    ASSERT_TRUE(std::holds_alternative<Failure>(out));
    EXPECT_EQ(std::get<Failure>(out).kind, ErrorKind::Cancelled);
}

TEST_F(WipeEngineTest, CancellationDuringPassIsNotRetried)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    EXPECT_CALL(m_ops, overwrite(_, _, _))
        .Times(1)
        .WillOnce(Throw(wipecert::core::OperationCancelled{ "operation cancelled" }));

    auto engine{ makeEngine() };
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<Failure>(out));
    EXPECT_EQ(std::get<Failure>(out).kind, ErrorKind::Cancelled);
    EXPECT_EQ(m_sleeps, 0);
}

TEST_F(WipeEngineTest, CancellationDuringBackoffStopsRetrying)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    EXPECT_CALL(m_ops, overwrite(_, _, _)).Times(1).WillOnce(Throw(std::runtime_error{ "busy" }));

    wipecert::core::WipeEngine engine{ m_ops, {}, {},
                                       [](std::chrono::milliseconds, const wipecert::core::CancellationToken&)
                                       { return false; } };
    const auto out{ engine.erase(device, EraseMode::Quick) };
    ASSERT_TRUE(std::holds_alternative<Failure>(out));
    const auto& failure{ std::get<Failure>(out) };
    EXPECT_EQ(failure.kind, ErrorKind::Cancelled);
    ASSERT_EQ(failure.messages.size(), 1U);
    EXPECT_EQ(failure.messages[0], "Attempt 1 failed: busy");
}

TEST(CancellationToken, WaitForReturnsEarlyWhenCancelled)
{
    wipecert::core::CancellationToken token{};
    EXPECT_TRUE(token.waitFor(std::chrono::milliseconds{ 1 }));
    token.cancel();
    EXPECT_FALSE(token.waitFor(std::chrono::hours{ 1 }));
    EXPECT_THROW(token.throwIfCancelled(), wipecert::core::OperationCancelled);
}
