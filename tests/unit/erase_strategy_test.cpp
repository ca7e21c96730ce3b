#include "test_utils/TestUtils.hpp"
#include "wipecert/core/EraseStrategy.hpp"
#include <gtest/gtest.h>

namespace
{

using wipecert::core::DeviceType;
using wipecert::core::EraseMode;
using wipecert::core::PlannedStep;
using wipecert::core::StepKind;

[[nodiscard]] PlannedStep ow(std::uint8_t pattern)
{
    return PlannedStep{ .kind = StepKind::Overwrite, .pattern = pattern };
}

[[nodiscard]] PlannedStep step(StepKind kind)
{
    return PlannedStep{ .kind = kind, .pattern = 0x00U };
}

} // namespace

TEST(MultiPassPatterns, CyclesAndEndsWithZero)
{
    const auto three{ wipecert::core::multiPassPatterns(3U) };
    EXPECT_EQ(three, (std::vector<std::uint8_t>{ 0x00U, 0xFFU, 0xAAU, 0x00U }));

    const auto seven{ wipecert::core::multiPassPatterns(7U) };
    EXPECT_EQ(seven, (std::vector<std::uint8_t>{ 0x00U, 0xFFU, 0xAAU, 0x55U, 0x00U, 0xFFU, 0xAAU, 0x00U }));
}

TEST(MultiPassPatterns, ZeroPassesStillWritesFinalZero)
{
    EXPECT_EQ(wipecert::core::multiPassPatterns(0U), (std::vector<std::uint8_t>{ 0x00U }));
}

TEST(ResolvePlan, HddQuickIsSingleZeroPass)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    const auto plan{ wipecert::core::resolvePlan(device, EraseMode::Quick) };
    EXPECT_EQ(plan.steps, (std::vector<PlannedStep>{ ow(0x00U) }));
    EXPECT_FALSE(plan.usedFallback);
    EXPECT_EQ(plan.expectedPattern(), std::optional<std::uint8_t>{ 0x00U });
}

TEST(ResolvePlan, HddAdvancedUsesSecureEraseWhenSupported)
{
    auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    device.supportsSecureErase = true;
    const auto plan{ wipecert::core::resolvePlan(device, EraseMode::Advanced) };
    EXPECT_EQ(plan.steps, (std::vector<PlannedStep>{ step(StepKind::SecureErase) }));
    EXPECT_FALSE(plan.usedFallback);
    EXPECT_TRUE(plan.usesFirmwareErase());
    EXPECT_FALSE(plan.expectedPattern().has_value());
}

TEST(ResolvePlan, HddAdvancedFallsBackToSevenPasses)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::HDD) };
    const auto plan{ wipecert::core::resolvePlan(device, EraseMode::Advanced) };
    EXPECT_TRUE(plan.usedFallback);
    ASSERT_EQ(plan.steps.size(), 8U);
    EXPECT_EQ(plan.steps.back(), ow(0x00U));
    EXPECT_FALSE(plan.usesFirmwareErase());
}

TEST(ResolvePlan, SsdQuickTrimsWhenSupported)
{
    auto device{ wipecert::test_utils::makeDevice(DeviceType::SSD) };
    device.supportsTrim = true;
    EXPECT_EQ(wipecert::core::resolvePlan(device, EraseMode::Quick).steps,
              (std::vector<PlannedStep>{ step(StepKind::Trim) }));

    device.supportsTrim = false;
    const auto fallback{ wipecert::core::resolvePlan(device, EraseMode::Quick) };
    EXPECT_EQ(fallback.steps, (std::vector<PlannedStep>{ ow(0x00U) }));
    EXPECT_TRUE(fallback.usedFallback);
}

TEST(ResolvePlan, SsdFullDropsMissingTrimAndKeepsFfPass)
{
    auto device{ wipecert::test_utils::makeDevice(DeviceType::SSD) };
    device.supportsTrim = true;
    EXPECT_EQ(wipecert::core::resolvePlan(device, EraseMode::Full).steps,
              (std::vector<PlannedStep>{ step(StepKind::Trim), ow(0xFFU) }));

    device.supportsTrim = false;
    const auto plan{ wipecert::core::resolvePlan(device, EraseMode::Full) };
    EXPECT_EQ(plan.steps, (std::vector<PlannedStep>{ ow(0xFFU) }));
    EXPECT_FALSE(plan.usedFallback);
    EXPECT_EQ(plan.expectedPattern(), std::optional<std::uint8_t>{ 0xFFU });
}

TEST(ResolvePlan, SsdAdvancedFallbackIsTrimPlusThreePasses)
{
    auto device{ wipecert::test_utils::makeDevice(DeviceType::SSD) };
    device.supportsTrim = true;
    const auto plan{ wipecert::core::resolvePlan(device, EraseMode::Advanced) };
    EXPECT_TRUE(plan.usedFallback);
    EXPECT_EQ(plan.steps, (std::vector<PlannedStep>{ step(StepKind::Trim), ow(0x00U), ow(0xFFU), ow(0xAAU),
                                                      ow(0x00U) }));
}

TEST(ResolvePlan, NvmeRowUsesFirmwareCommands)
{
    const auto device{ wipecert::test_utils::makeDevice(DeviceType::NVMe) };
    EXPECT_EQ(wipecert::core::resolvePlan(device, EraseMode::Quick).steps,
              (std::vector<PlannedStep>{ step(StepKind::NvmeFormat) }));
    EXPECT_EQ(wipecert::core::resolvePlan(device, EraseMode::Full).steps,
              (std::vector<PlannedStep>{ step(StepKind::NvmeFormat), ow(0xFFU) }));
    EXPECT_EQ(wipecert::core::resolvePlan(device, EraseMode::Advanced).steps,
              (std::vector<PlannedStep>{ step(StepKind::CryptoErase) }));
}

TEST(ResolvePlan, UsbAndUnknownAreSoftwareOnly)
{
    auto usb{ wipecert::test_utils::makeDevice(DeviceType::USB) };
    usb.supportsSecureErase = true;
    usb.supportsTrim = true;
    EXPECT_EQ(wipecert::core::resolvePlan(usb, EraseMode::Advanced).steps.size(), 8U);
    EXPECT_FALSE(wipecert::core::resolvePlan(usb, EraseMode::Advanced).usesFirmwareErase());

    const auto unknown{ wipecert::test_utils::makeDevice(DeviceType::Unknown) };
    EXPECT_EQ(wipecert::core::resolvePlan(unknown, EraseMode::Full).steps.size(), 4U);
    EXPECT_EQ(wipecert::core::resolvePlan(unknown, EraseMode::Advanced).steps.size(), 6U);
}

TEST(StepKindNames, AreStable)
{
    EXPECT_EQ(wipecert::core::toString(StepKind::Trim), "TRIM");
    EXPECT_EQ(wipecert::core::toString(StepKind::NvmeFormat), "NVMeFormat");
    EXPECT_EQ(wipecert::core::toString(StepKind::CryptoErase), "CryptoErase");
}
