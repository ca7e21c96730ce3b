#ifndef INCLUDE_WIPECERT_CORE_CLOCK_HPP
#define INCLUDE_WIPECERT_CORE_CLOCK_HPP

#include <cstdint>
#include <functional>

namespace wipecert::core
{

// Returns unix seconds. Injected so tests can pin timestamps.
using NowProvider = std::function<std::uint64_t()>;

// Wall clock in unix seconds, clamped to 0 for pre-epoch clocks.
[[nodiscard]] std::uint64_t unixSecondsNow() noexcept;

} // namespace wipecert::core

#endif // INCLUDE_WIPECERT_CORE_CLOCK_HPP
