#ifndef INCLUDE_WIPECERT_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_WIPECERT_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>

namespace wipecert::security
{
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// Wipes the characters (including any spare capacity) and leaves the string empty.
// Used for PEM text that carried key material.
void secureWipe(std::string& text) noexcept;

} // namespace wipecert::security
#endif // INCLUDE_WIPECERT_SECURITY_MEMORYWIPER_HPP
