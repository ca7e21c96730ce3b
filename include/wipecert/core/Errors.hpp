#ifndef INCLUDE_WIPECERT_CORE_ERRORS_HPP
#define INCLUDE_WIPECERT_CORE_ERRORS_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wipecert::core
{

enum class ErrorKind : std::uint8_t
{
    Io,
    Serialization,
    Crypto,
    DeviceNotFound,
    PermissionDenied,
    UnsupportedPlatform,
    UnsupportedDeviceType,
    SecureEraseNotSupported,
    WipeFailed,
    VerificationFailed,
    CertificateGenerationFailed,
    CertificateVerificationFailed,
    InvalidEraseMode,
    HiddenAreaAccessFailed,
    Cancelled,
};

struct Failure final
{
    ErrorKind kind{ ErrorKind::Io };
    std::string summary;
    // Underlying causes in the order they happened (for WipeFailed: one entry per attempt).
    std::vector<std::string> messages;
};

template <class T> using Result = std::variant<T, Failure>;

[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

// "<Kind>: <summary>" followed by one "  - <message>" line per cause.
[[nodiscard]] std::string describe(const Failure& failure);

} // namespace wipecert::core

#endif // INCLUDE_WIPECERT_CORE_ERRORS_HPP
