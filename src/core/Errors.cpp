#include "wipecert/core/Errors.hpp"

namespace wipecert::core
{

std::string_view toString(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::Io:
        return "IoError";
    case ErrorKind::Serialization:
        return "SerializationError";
    case ErrorKind::Crypto:
        return "CryptoError";
    case ErrorKind::DeviceNotFound:
        return "DeviceNotFound";
    case ErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ErrorKind::UnsupportedPlatform:
        return "UnsupportedPlatform";
    case ErrorKind::UnsupportedDeviceType:
        return "UnsupportedDeviceType";
    case ErrorKind::SecureEraseNotSupported:
        return "SecureEraseNotSupported";
    case ErrorKind::WipeFailed:
        return "WipeFailed";
    case ErrorKind::VerificationFailed:
        return "VerificationFailed";
    case ErrorKind::CertificateGenerationFailed:
        return "CertificateGenerationFailed";
    case ErrorKind::CertificateVerificationFailed:
        return "CertificateVerificationFailed";
    case ErrorKind::InvalidEraseMode:
        return "InvalidEraseMode";
    case ErrorKind::HiddenAreaAccessFailed:
        return "HiddenAreaAccessFailed";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

std::string describe(const Failure& failure)
{
    std::string out{ toString(failure.kind) };
    if (!failure.summary.empty())
    {
        out.append(": ");
        out.append(failure.summary);
    }
    for (const auto& message : failure.messages)
    {
        out.append("\n  - ");
        out.append(message);
    }
    return out;
}

} // namespace wipecert::core
