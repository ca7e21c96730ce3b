#include "wipecert/core/Clock.hpp"
#include <chrono>

namespace wipecert::core
{

std::uint64_t unixSecondsNow() noexcept
{
    using Clock = std::chrono::system_clock;
    const auto now{ Clock::now() };
    const auto secs{ std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()) };
    const auto count{ secs.count() };
    if (count < 0)
    {
        return 0U;
    }
    return static_cast<std::uint64_t>(count);
}

} // namespace wipecert::core
