#include "wipecert/core/EraseStrategy.hpp"
#include <utility>

namespace wipecert::core
{
namespace
{

constexpr std::size_t g_kModeCount{ 3U };
constexpr std::size_t g_kDeviceTypeCount{ 5U };

constexpr StepDescriptor overwrite(std::uint8_t pattern) noexcept
{
    return StepDescriptor{ .kind = StepKind::Overwrite, .pattern = pattern };
}

constexpr StepDescriptor multiPass(std::uint8_t passes) noexcept
{
    return StepDescriptor{ .kind = StepKind::MultiPass, .passes = passes };
}

constexpr StepDescriptor trim(bool optional) noexcept
{
    return StepDescriptor{ .kind = StepKind::Trim, .needs = Capability::Trim, .optional = optional };
}

constexpr StepDescriptor secureErase() noexcept
{
    return StepDescriptor{ .kind = StepKind::SecureErase, .needs = Capability::SecureErase };
}

constexpr StepDescriptor single(StepKind kind) noexcept
{
    return StepDescriptor{ .kind = kind };
}

constexpr Procedure proc(StepDescriptor a) noexcept
{
    return Procedure{ .steps = { a, StepDescriptor{} }, .stepCount = 1U };
}

constexpr Procedure proc(StepDescriptor a, StepDescriptor b) noexcept
{
    return Procedure{ .steps = { a, b }, .stepCount = 2U };
}

constexpr ProcedureDescriptor cell(Procedure primary) noexcept
{
    return ProcedureDescriptor{ .primary = primary, .fallback = std::nullopt };
}

constexpr ProcedureDescriptor cell(Procedure primary, Procedure fallback) noexcept
{
    return ProcedureDescriptor{ .primary = primary, .fallback = fallback };
}

// Rows follow DeviceType, columns follow EraseMode.
constexpr std::array<std::array<ProcedureDescriptor, g_kModeCount>, g_kDeviceTypeCount> g_kStrategyTable{ {
    // HDD
    { {
        cell(proc(overwrite(0x00U))),
        cell(proc(multiPass(3U))),
        cell(proc(secureErase()), proc(multiPass(7U))),
    } },
    // SSD
    { {
        cell(proc(trim(false)), proc(overwrite(0x00U))),
        cell(proc(trim(true), overwrite(0xFFU))),
        cell(proc(secureErase()), proc(trim(true), multiPass(3U))),
    } },
    // NVMe
    { {
        cell(proc(single(StepKind::NvmeFormat))),
        cell(proc(single(StepKind::NvmeFormat), overwrite(0xFFU))),
        cell(proc(single(StepKind::CryptoErase))),
    } },
    // USB: no firmware erase path
    { {
        cell(proc(overwrite(0x00U))),
        cell(proc(multiPass(3U))),
        cell(proc(multiPass(7U))),
    } },
    // Unknown
    { {
        cell(proc(overwrite(0x00U))),
        cell(proc(multiPass(3U))),
        cell(proc(multiPass(5U))),
    } },
} };

[[nodiscard]] bool hasCapability(const StorageDevice& device, Capability capability) noexcept
{
    switch (capability)
    {
    case Capability::None:
        return true;
    case Capability::Trim:
        return device.supportsTrim;
    case Capability::SecureErase:
        return device.supportsSecureErase;
    }
    return false;
}

// Returns false when a mandatory step needs a capability the device lacks.
[[nodiscard]] bool expand(const Procedure& procedure, const StorageDevice& device, std::vector<PlannedStep>& out)
{
    std::vector<PlannedStep> steps{};
    for (std::size_t i{}; i < procedure.stepCount; ++i)
    {
        const auto& step{ procedure.steps[i] };
        if (!hasCapability(device, step.needs))
        {
            if (step.optional)
            {
                continue;
            }
            return false;
        }

        if (step.kind == StepKind::MultiPass)
        {
            for (const auto pattern : multiPassPatterns(step.passes))
            {
                steps.push_back(PlannedStep{ .kind = StepKind::Overwrite, .pattern = pattern });
            }
            continue;
        }
        steps.push_back(PlannedStep{ .kind = step.kind, .pattern = step.pattern });
    }
    out = std::move(steps);
    return true;
}

} // namespace

std::optional<std::uint8_t> ProcedurePlan::expectedPattern() const noexcept
{
    if (steps.empty() || steps.back().kind != StepKind::Overwrite)
    {
        return std::nullopt;
    }
    return steps.back().pattern;
}

bool ProcedurePlan::usesFirmwareErase() const noexcept
{
    for (const auto& step : steps)
    {
        if (step.kind == StepKind::SecureErase || step.kind == StepKind::NvmeFormat ||
            step.kind == StepKind::CryptoErase)
        {
            return true;
        }
    }
    return false;
}

const ProcedureDescriptor& lookupProcedure(DeviceType type, EraseMode mode) noexcept
{
    return g_kStrategyTable[static_cast<std::size_t>(type)][static_cast<std::size_t>(mode)];
}

std::vector<std::uint8_t> multiPassPatterns(std::uint32_t passes)
{
    std::vector<std::uint8_t> out{};
    out.reserve(static_cast<std::size_t>(passes) + 1U);
    for (std::uint32_t i{}; i < passes; ++i)
    {
        out.push_back(g_multiPassCycle[i % g_multiPassCycle.size()]);
    }
    out.push_back(0x00U);
    return out;
}

ProcedurePlan resolvePlan(const StorageDevice& device, EraseMode mode)
{
    const auto& descriptor{ lookupProcedure(device.type, mode) };

    ProcedurePlan plan{};
    if (expand(descriptor.primary, device, plan.steps))
    {
        return plan;
    }

    // Every fallback in the table is built from steps that need nothing or are optional.
    if (descriptor.fallback.has_value() && expand(*descriptor.fallback, device, plan.steps))
    {
        plan.usedFallback = true;
        return plan;
    }

    // Unreachable with the shipped table; a plain zero pass keeps the contract of never failing on capabilities.
    plan.steps = { PlannedStep{ .kind = StepKind::Overwrite, .pattern = 0x00U } };
    plan.usedFallback = true;
    return plan;
}

std::string_view toString(StepKind kind) noexcept
{
    switch (kind)
    {
    case StepKind::Overwrite:
        return "Overwrite";
    case StepKind::MultiPass:
        return "MultiPass";
    case StepKind::Trim:
        return "TRIM";
    case StepKind::SecureErase:
        return "SecureErase";
    case StepKind::NvmeFormat:
        return "NVMeFormat";
    case StepKind::CryptoErase:
        return "CryptoErase";
    }
    return "Unknown";
}

} // namespace wipecert::core
