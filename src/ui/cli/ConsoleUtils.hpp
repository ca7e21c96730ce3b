#ifndef WIPECERT_UI_CLI_CONSOLEUTILS_HPP
#define WIPECERT_UI_CLI_CONSOLEUTILS_HPP

#include <iosfwd>
#include <string_view>

namespace wipecert::ui::cli
{

// Keeps the signing key out of swap and core dumps.
void lockProcessMemory() noexcept;

// Prompts on `out` and returns true only when the operator types exactly `expected`.
[[nodiscard]] bool confirmDestruction(std::istream& in, std::ostream& out, std::string_view expected);

} // namespace wipecert::ui::cli

#endif // WIPECERT_UI_CLI_CONSOLEUTILS_HPP
