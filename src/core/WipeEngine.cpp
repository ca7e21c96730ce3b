#include "wipecert/core/WipeEngine.hpp"
#include "wipecert/security/SecureRandom.hpp"
#include <algorithm>
#include <glog/logging.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace wipecert::core
{
namespace
{

[[nodiscard]] bool defaultSleep(std::chrono::milliseconds duration, const CancellationToken& token)
{
    return token.waitFor(duration);
}

[[nodiscard]] bool isExposable(HiddenAreaKind kind) noexcept
{
    return kind == HiddenAreaKind::HPA || kind == HiddenAreaKind::DCO;
}

[[nodiscard]] bool isUniform(std::span<const std::uint8_t> sector, std::uint8_t value) noexcept
{
    return std::all_of(sector.begin(), sector.end(), [value](std::uint8_t b) { return b == value; });
}

[[nodiscard]] bool isErased(std::span<const std::uint8_t> sector, std::optional<std::uint8_t> expected) noexcept
{
    if (expected.has_value())
    {
        return isUniform(sector, *expected);
    }
    return isUniform(sector, 0x00U) || isUniform(sector, 0xFFU);
}

[[nodiscard]] Failure cancelledFailure(std::vector<std::string> errors)
{
    LOG(WARNING) << "Wipe cancelled";
    return Failure{ .kind = ErrorKind::Cancelled, .summary = "Wipe cancelled", .messages = std::move(errors) };
}

void addCapability(std::vector<StepKind>& used, StepKind kind)
{
    if (kind == StepKind::Overwrite || kind == StepKind::MultiPass)
    {
        return;
    }
    if (std::find(used.begin(), used.end(), kind) == used.end())
    {
        used.push_back(kind);
    }
}

} // namespace

bool meetsVerificationThreshold(std::uint32_t verified, std::uint32_t sampleCount, double threshold) noexcept
{
    if (sampleCount == 0U)
    {
        return false;
    }
    const double ratio{ static_cast<double>(verified) / static_cast<double>(sampleCount) };
    return ratio >= threshold;
}

WipeEngine::WipeEngine(wipecert::device::IDeviceOperations& ops, WipeEngineConfig config, NowProvider now,
                       Sleeper sleep)
    : m_ops{ ops }, m_config{ config }, m_now{ now ? std::move(now) : NowProvider{ &unixSecondsNow } },
      m_sleep{ sleep ? std::move(sleep) : Sleeper{ &defaultSleep } }
{
    m_config.maxRetries = std::max(m_config.maxRetries, 1U);
}

Result<WipeResult> WipeEngine::erase(const StorageDevice& device, EraseMode mode) noexcept
{
    const CancellationToken neverCancelled{};
    return erase(device, mode, neverCancelled);
}

Result<WipeResult> WipeEngine::erase(const StorageDevice& device, EraseMode mode,
                                     const CancellationToken& token) noexcept
{
    try
    {
        return eraseImpl(device, mode, token);
    }
    catch (const std::exception& e)
    {
        LOG(ERROR) << "Wipe of " << device.path << " aborted: " << e.what();
        return Failure{ .kind = ErrorKind::WipeFailed, .summary = e.what(), .messages = {} };
    }
}

Result<WipeResult> WipeEngine::eraseImpl(const StorageDevice& device, EraseMode mode,
                                         const CancellationToken& token)
{
    const ProcedurePlan plan{ resolvePlan(device, mode) };
    LOG(INFO) << "Erasing " << device.path << " (" << toString(device.type) << ", " << toString(mode) << "): "
              << plan.steps.size() << " step(s)" << (plan.usedFallback ? ", software fallback" : "");

    WipeResult result{};
    result.device = device;
    result.mode = mode;
    result.startTime = m_now();
    result.hiddenAreasCleared.assign(device.hiddenAreas.size(), false);

    std::vector<bool> exposed(device.hiddenAreas.size(), false);
    for (std::size_t i{}; i < device.hiddenAreas.size(); ++i)
    {
        const auto& area{ device.hiddenAreas[i] };
        if (!isExposable(area.kind))
        {
            continue;
        }
        try
        {
            m_ops.exposeHiddenArea(device, area);
            exposed[i] = true;
            VLOG(1) << "Exposed hidden area " << area.description;
        }
        catch (const std::exception& e)
        {
            std::string message{ "Hidden area " + area.description + " could not be exposed: " + e.what() };
            LOG(WARNING) << message;
            result.errors.push_back(std::move(message));
        }
    }

    std::vector<std::string> attemptErrors{};
    bool succeeded{ false };
    for (std::uint32_t attempt{ 1U }; attempt <= m_config.maxRetries; ++attempt)
    {
        if (token.isCancelled())
        {
            return cancelledFailure(std::move(result.errors));
        }

        LOG(INFO) << "Attempt " << attempt << "/" << m_config.maxRetries << " on " << device.path;
        ++result.attempts;
        try
        {
            result.passesCompleted = runPlan(device, plan, token);
            succeeded = true;
            break;
        }
        catch (const OperationCancelled&)
        {
            return cancelledFailure(std::move(result.errors));
        }
        catch (const std::exception& e)
        {
            std::string message{ "Attempt " + std::to_string(attempt) + " failed: " + e.what() };
            LOG(WARNING) << message;
            result.errors.push_back(message);
            attemptErrors.push_back(std::move(message));
        }

        if (attempt < m_config.maxRetries && !m_sleep(m_config.retryBackoff, token))
        {
            return cancelledFailure(std::move(result.errors));
        }
    }

    if (!succeeded)
    {
        std::string summary{ "All " + std::to_string(m_config.maxRetries) + " wipe attempts failed" };
        LOG(ERROR) << summary << " on " << device.path;
        return Failure{ .kind = ErrorKind::WipeFailed, .summary = std::move(summary), .messages = std::move(attemptErrors) };
    }

    result.endTime = m_now();
    result.durationSeconds = (result.endTime > result.startTime) ? (result.endTime - result.startTime) : 0U;
    result.bytesWritten = device.size;
    for (const auto& step : plan.steps)
    {
        addCapability(result.capabilitiesUsed, step.kind);
    }
    for (std::size_t i{}; i < device.hiddenAreas.size(); ++i)
    {
        result.hiddenAreasCleared[i] = isExposable(device.hiddenAreas[i].kind) ? exposed[i] : plan.usesFirmwareErase();
    }

    result.sampleCount = m_config.sampleCount;
    try
    {
        if (device.sectorCount() == 0U)
        {
            throw std::runtime_error{ "device reports no addressable sectors" };
        }
        const auto verification{ sampleSectors(device, plan, token) };
        result.verifiedSamples = verification.verified;
        if (verification.interrupted)
        {
            result.errors.emplace_back("Verification interrupted by cancellation");
        }
    }
    catch (const std::exception& e)
    {
        result.verifiedSamples = 0U;
        result.errors.push_back(std::string{ "Verification failed: " } + e.what());
    }

    result.verificationRatio = (result.sampleCount == 0U)
                                   ? 0.0
                                   : static_cast<double>(result.verifiedSamples) /
                                         static_cast<double>(result.sampleCount);
    result.verificationPassed =
        meetsVerificationThreshold(result.verifiedSamples, result.sampleCount, m_config.verificationThreshold);

    if (result.verificationPassed)
    {
        LOG(INFO) << "Verification passed: " << result.verifiedSamples << "/" << result.sampleCount;
    }
    else
    {
        LOG(WARNING) << "Verification below threshold: " << result.verifiedSamples << "/" << result.sampleCount;
    }
    return result;
}

std::uint32_t WipeEngine::runPlan(const StorageDevice& device, const ProcedurePlan& plan,
                                  const CancellationToken& token)
{
    std::uint32_t passes{ 0U };
    for (const auto& step : plan.steps)
    {
        token.throwIfCancelled();
        VLOG(1) << "Step " << toString(step.kind) << " on " << device.path;
        switch (step.kind)
        {
        case StepKind::Overwrite:
        case StepKind::MultiPass:
            static_cast<void>(m_ops.overwrite(device, step.pattern, token));
            break;
        case StepKind::Trim:
            m_ops.trim(device);
            break;
        case StepKind::SecureErase:
            m_ops.secureErase(device);
            break;
        case StepKind::NvmeFormat:
            m_ops.nvmeFormat(device, true);
            break;
        case StepKind::CryptoErase:
            m_ops.cryptoErase(device);
            break;
        }
        ++passes;
    }
    return passes;
}

WipeEngine::Verification WipeEngine::sampleSectors(const StorageDevice& device, const ProcedurePlan& plan,
                                                   const CancellationToken& token)
{
    const auto expected{ plan.expectedPattern() };
    const auto sectors{ device.sectorCount() };
    std::vector<std::uint8_t> sector(device.sectorSize);

    Verification out{};
    for (std::uint32_t i{}; i < m_config.sampleCount; ++i)
    {
        if (token.isCancelled())
        {
            out.interrupted = true;
            return out;
        }

        std::uint64_t index{ 0U };
        if (!wipecert::security::secureRandomBounded(sectors, index))
        {
            throw std::runtime_error{ "random sector selection failed" };
        }

        bool erased{ false };
        try
        {
            erased = m_ops.readSector(device, index, sector) && isErased(sector, expected);
        }
        catch (const std::exception& e)
        {
            VLOG(1) << "Sector " << index << " unreadable: " << e.what();
        }
        if (erased)
        {
            ++out.verified;
        }
    }
    return out;
}

} // namespace wipecert::core
