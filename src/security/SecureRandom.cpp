#include "wipecert/security/SecureRandom.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>

#if defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace wipecert::security
{
namespace
{

template <class T> [[nodiscard]] bool secureRandomValue(T& out) noexcept
{
    std::array<std::uint8_t, sizeof(T)> bytes{};
    if (!secureRandomFill(std::span{ bytes }))
    {
        return false;
    }

    T value{};
    std::memcpy(&value, bytes.data(), sizeof(value));
    out = value;
    return true;
}

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::uint8_t* outPtr{ out.data() };
    std::size_t remaining{ out.size() };
    while (remaining > 0U)
    {
        const ssize_t bytesReceived{ ::getrandom(outPtr, remaining, 0) };

        if (bytesReceived > 0)
        {
            const std::size_t received{ static_cast<std::size_t>(bytesReceived) };
            if (received > remaining)
            {
                return false;
            }
            remaining -= received;
            outPtr += received;
            continue;
        }

        if (bytesReceived < 0 && errno == EINTR)
        {
            continue;
        }

        return false;
    }
    return true;
}

bool secureRandomUint32(std::uint32_t& out) noexcept
{
    return secureRandomValue(out);
}

bool secureRandomUint64(std::uint64_t& out) noexcept
{
    return secureRandomValue(out);
}

bool secureRandomBounded(std::uint64_t maxExcl, std::uint64_t& out) noexcept
{
    if (maxExcl == 0U)
    {
        return false;
    }
    if (maxExcl == 1U)
    {
        out = 0U;
        return true;
    }

    const std::uint64_t limit{ (std::numeric_limits<std::uint64_t>::max() / maxExcl) * maxExcl };

    constexpr std::size_t kMaxAttempts{ 128U };
    for (std::size_t attempt{}; attempt < kMaxAttempts; ++attempt)
    {
        std::uint64_t candidate{};
        if (!secureRandomUint64(candidate))
        {
            return false;
        }

        if (candidate < limit)
        {
            out = candidate % maxExcl;
            return true;
        }
    }
    return false;
}

} // namespace wipecert::security
