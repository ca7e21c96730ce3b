#ifndef INCLUDE_WIPECERT_CORE_WIPEENGINE_HPP
#define INCLUDE_WIPECERT_CORE_WIPEENGINE_HPP

#include "wipecert/core/CancellationToken.hpp"
#include "wipecert/core/Clock.hpp"
#include "wipecert/core/EraseStrategy.hpp"
#include "wipecert/core/Errors.hpp"
#include "wipecert/core/StorageDevice.hpp"
#include "wipecert/core/WipeResult.hpp"
#include "wipecert/device/IDeviceOperations.hpp"
#include <chrono>
#include <cstdint>
#include <functional>

namespace wipecert::core
{

struct WipeEngineConfig final
{
    std::uint32_t maxRetries{ 3U }; // values below 1 behave as 1
    std::chrono::milliseconds retryBackoff{ 5000 };
    std::uint32_t sampleCount{ 100U };
    double verificationThreshold{ 0.95 }; // inclusive
};

// Waits between attempts. Returns false when the token was cancelled during the wait.
using Sleeper = std::function<bool(std::chrono::milliseconds, const CancellationToken&)>;

// Runs the procedure chosen by the strategy table, retries failed attempts and samples the device afterwards.
// Callers must not run two erasures of the same device at once (see DeviceLockRegistry).
class WipeEngine final
{
public:
    explicit WipeEngine(wipecert::device::IDeviceOperations& ops, WipeEngineConfig config = {}, NowProvider now = {},
                        Sleeper sleep = {});

    // Fails with WipeFailed when every attempt threw, or with Cancelled.
    // Verification shortfalls never fail the call; they surface in the result.
    [[nodiscard]] Result<WipeResult> erase(const StorageDevice& device, EraseMode mode) noexcept;
    [[nodiscard]] Result<WipeResult> erase(const StorageDevice& device, EraseMode mode,
                                           const CancellationToken& token) noexcept;

    [[nodiscard]] const WipeEngineConfig& config() const noexcept
    {
        return m_config;
    }

private:
    struct Verification final
    {
        std::uint32_t verified{ 0U };
        bool interrupted{ false };
    };

    [[nodiscard]] std::uint32_t runPlan(const StorageDevice& device, const ProcedurePlan& plan,
                                        const CancellationToken& token);
    [[nodiscard]] Verification sampleSectors(const StorageDevice& device, const ProcedurePlan& plan,
                                             const CancellationToken& token);
    [[nodiscard]] Result<WipeResult> eraseImpl(const StorageDevice& device, EraseMode mode,
                                               const CancellationToken& token);

    wipecert::device::IDeviceOperations& m_ops;
    WipeEngineConfig m_config;
    NowProvider m_now;
    Sleeper m_sleep;
};

[[nodiscard]] bool meetsVerificationThreshold(std::uint32_t verified, std::uint32_t sampleCount,
                                              double threshold) noexcept;

} // namespace wipecert::core

#endif // INCLUDE_WIPECERT_CORE_WIPEENGINE_HPP
