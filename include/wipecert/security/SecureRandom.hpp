#ifndef INCLUDE_WIPECERT_SECURITY_SECURERANDOM_HPP
#define INCLUDE_WIPECERT_SECURITY_SECURERANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace wipecert::security
{

// All functions draw from the kernel CSPRNG and report failure instead of throwing.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;
[[nodiscard]] bool secureRandomUint32(std::uint32_t& out) noexcept;
[[nodiscard]] bool secureRandomUint64(std::uint64_t& out) noexcept;

// Uniform in [0, maxExcl) without modulo bias. Fails for maxExcl == 0.
[[nodiscard]] bool secureRandomBounded(std::uint64_t maxExcl, std::uint64_t& out) noexcept;

} // namespace wipecert::security

#endif // INCLUDE_WIPECERT_SECURITY_SECURERANDOM_HPP
