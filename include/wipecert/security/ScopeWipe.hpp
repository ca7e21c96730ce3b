#ifndef INCLUDE_WIPECERT_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_WIPECERT_SECURITY_SCOPEWIPE_HPP

#include "wipecert/security/MemoryWiper.hpp"
#include "wipecert/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace wipecert::security
{
class [[nodiscard]] ScopeWipe final
{
public:
    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    explicit ScopeWipe(std::span<std::byte> b) noexcept : m_bytes{ b }
    {
    }

    ScopeWipe(ScopeWipe&& sw) noexcept : m_bytes{ sw.m_bytes }, m_active{ sw.m_active }
    {
        sw.release();
    }

    ~ScopeWipe() noexcept
    {
        if (m_active && !m_bytes.empty())
        {
            secureWipe(m_bytes);
        }
    }

    ScopeWipe& operator=(ScopeWipe&&) = delete;

    void release() noexcept
    {
        m_active = false;
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
    bool m_active{ true };
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

template <std::size_t N> [[nodiscard]] inline ScopeWipe scopeWipe(std::array<std::uint8_t, N>& a) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span{ a }) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ asWritableBytes(b) };
}

// Guards the current contents of a string holding PEM text.
[[nodiscard]] inline ScopeWipe scopeWipe(std::string& s) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<char>{ s.data(), s.size() }) };
}

} // namespace wipecert::security

#endif // INCLUDE_WIPECERT_SECURITY_SCOPEWIPE_HPP
