#ifndef INCLUDE_WIPECERT_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_WIPECERT_SECURITY_SECUREBUFFER_HPP

#include "wipecert/security/MemoryWiper.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <span>
#include <type_traits>
#include <vector>

namespace wipecert::security
{

// Allocator that wipes every block before handing it back to the heap.
template <class T> struct ZeroAllocator
{
    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& u) noexcept {};

    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        if (n != 0U)
        {
            secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(p), n * sizeof(T) });
        }
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& t,
                          [[maybe_unused]] const ZeroAllocator<U>& u) noexcept
{
    return true;
}

// Holds signing seeds and decoded key material.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureBuffer(bytes.begin(), bytes.end());
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
    SecureBuffer temp;
    b.swap(temp);
}

} // namespace wipecert::security

#endif // INCLUDE_WIPECERT_SECURITY_SECUREBUFFER_HPP
