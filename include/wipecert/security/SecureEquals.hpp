#ifndef INCLUDE_WIPECERT_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_WIPECERT_SECURITY_SECUREEQUALS_HPP

#include "wipecert/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace wipecert::security
{
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};

    for (std::size_t i{}; i < a.size(); ++i)
    {
        const unsigned char x{ std::to_integer<unsigned char>(a[i]) };
        const unsigned char y{ std::to_integer<unsigned char>(b[i]) };

        diff |= (x ^ y);
    }

    return (diff == 0);
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

// Digest comparison on hex text: length leaks, position of the first difference does not.
[[nodiscard]] inline bool secureEquals(std::string_view a, std::string_view b) noexcept
{
    return secureEquals(std::as_bytes(std::span<const char>{ a.data(), a.size() }),
                        std::as_bytes(std::span<const char>{ b.data(), b.size() }));
}

[[nodiscard]] inline bool secureEquals(const SecureBuffer& a, const SecureBuffer& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace wipecert::security

#endif // INCLUDE_WIPECERT_SECURITY_SECUREEQUALS_HPP
