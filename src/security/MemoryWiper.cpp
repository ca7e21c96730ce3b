#include "wipecert/security/MemoryWiper.hpp"

#if defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace wipecert::security
{
void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
    ::explicit_bzero(bytes.data(), bytes.size());
}

void secureWipe(std::string& text) noexcept
{
    if (text.capacity() == 0U)
    {
        return;
    }
    // The whole allocation, not only size(): earlier contents may sit past the terminator.
    ::explicit_bzero(text.data(), text.capacity());
    text.clear();
}
} // namespace wipecert::security
