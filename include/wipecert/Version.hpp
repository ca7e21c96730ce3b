#ifndef INCLUDE_WIPECERT_VERSION_HPP
#define INCLUDE_WIPECERT_VERSION_HPP

#include <string_view>

namespace wipecert
{

inline constexpr std::string_view g_toolVersion{ "0.1.0" };

} // namespace wipecert

#endif // INCLUDE_WIPECERT_VERSION_HPP
