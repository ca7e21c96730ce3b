#include "ConsoleUtils.hpp"

#include <glog/logging.h>
#include <istream>
#include <ostream>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#else
#error "Unsupported platform"
#endif

namespace wipecert::ui::cli
{

namespace
{
[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
    constexpr std::string_view kBlank{ " \t\r\n" };
    const auto first = s.find_first_not_of(kBlank);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = s.find_last_not_of(kBlank);
    return s.substr(first, last - first + 1U);
}
} // namespace

void lockProcessMemory() noexcept
{
    if (mlockall(MCL_CURRENT | MCL_FUTURE) != 0)
    {
        VLOG(1) << "mlockall failed; key material may be swapped";
    }
    struct rlimit lim
    {
        0, 0
    };
    (void)setrlimit(RLIMIT_CORE, &lim);
}

bool confirmDestruction(std::istream& in, std::ostream& out, std::string_view expected)
{
    out << "Type '" << expected << "' to continue: " << std::flush;

    std::string line;
    if (!std::getline(in, line))
    {
        out << "\n";
        return false;
    }
    return trim(line) == expected;
}

} // namespace wipecert::ui::cli
