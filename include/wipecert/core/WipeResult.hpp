#ifndef INCLUDE_WIPECERT_CORE_WIPERESULT_HPP
#define INCLUDE_WIPECERT_CORE_WIPERESULT_HPP

#include "wipecert/core/EraseStrategy.hpp"
#include "wipecert/core/StorageDevice.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace wipecert::core
{

// Outcome of one successful erase invocation. Sole input to certificate issuance.
struct WipeResult final
{
    StorageDevice device{};
    EraseMode mode{ EraseMode::Quick };
    std::uint64_t startTime{ 0U }; // unix seconds
    std::uint64_t endTime{ 0U };
    std::uint64_t durationSeconds{ 0U };
    std::uint64_t bytesWritten{ 0U };
    bool verificationPassed{ false };
    // Hidden-area problems, then failed attempts, then verification problems.
    std::vector<std::string> errors;

    std::uint32_t attempts{ 0U };
    std::uint32_t passesCompleted{ 0U };
    std::uint32_t sampleCount{ 0U };
    std::uint32_t verifiedSamples{ 0U };
    double verificationRatio{ 0.0 };
    // Firmware or TRIM paths the successful attempt actually took, without duplicates.
    std::vector<StepKind> capabilitiesUsed;
    // Parallel to device.hiddenAreas.
    std::vector<bool> hiddenAreasCleared;
};

} // namespace wipecert::core

#endif // INCLUDE_WIPECERT_CORE_WIPERESULT_HPP
