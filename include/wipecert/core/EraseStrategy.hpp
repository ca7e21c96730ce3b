#ifndef INCLUDE_WIPECERT_CORE_ERASESTRATEGY_HPP
#define INCLUDE_WIPECERT_CORE_ERASESTRATEGY_HPP

#include "wipecert/core/StorageDevice.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace wipecert::core
{

enum class StepKind : std::uint8_t
{
    Overwrite,
    MultiPass,
    Trim,
    SecureErase,
    NvmeFormat,
    CryptoErase,
};

enum class Capability : std::uint8_t
{
    None,
    Trim,
    SecureErase,
};

struct StepDescriptor final
{
    StepKind kind{ StepKind::Overwrite };
    std::uint8_t pattern{ 0x00U };  // Overwrite only
    std::uint8_t passes{ 0U };      // MultiPass only
    Capability needs{ Capability::None };
    // An optional step whose capability is missing is dropped instead of triggering the fallback.
    bool optional{ false };
};

constexpr std::size_t g_maxProcedureSteps{ 2U };

struct Procedure final
{
    std::array<StepDescriptor, g_maxProcedureSteps> steps{};
    std::size_t stepCount{ 0U };
};

// One cell of the (DeviceType, EraseMode) table.
struct ProcedureDescriptor final
{
    Procedure primary{};
    std::optional<Procedure> fallback{};
};

struct PlannedStep final
{
    StepKind kind{ StepKind::Overwrite };
    std::uint8_t pattern{ 0x00U };

    friend bool operator==(const PlannedStep&, const PlannedStep&) = default;
};

// Procedure with capabilities resolved and multi-pass runs expanded into single overwrite passes.
struct ProcedurePlan final
{
    std::vector<PlannedStep> steps;
    bool usedFallback{ false };

    // Byte every sector should hold afterwards. std::nullopt when a firmware command (or TRIM) runs last;
    // such plans accept sectors uniformly filled with 0x00 or 0xFF.
    [[nodiscard]] std::optional<std::uint8_t> expectedPattern() const noexcept;

    // True when a whole-device firmware command (secure erase, format, crypto erase) is part of the plan.
    [[nodiscard]] bool usesFirmwareErase() const noexcept;
};

constexpr std::array<std::uint8_t, 4> g_multiPassCycle{ 0x00U, 0xFFU, 0xAAU, 0x55U };

[[nodiscard]] const ProcedureDescriptor& lookupProcedure(DeviceType type, EraseMode mode) noexcept;

// `passes` patterns taken from the cycle, then a mandatory final 0x00 pass.
[[nodiscard]] std::vector<std::uint8_t> multiPassPatterns(std::uint32_t passes);

[[nodiscard]] ProcedurePlan resolvePlan(const StorageDevice& device, EraseMode mode);

[[nodiscard]] std::string_view toString(StepKind kind) noexcept;

} // namespace wipecert::core

#endif // INCLUDE_WIPECERT_CORE_ERASESTRATEGY_HPP
