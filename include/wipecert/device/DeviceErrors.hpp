#ifndef INCLUDE_WIPECERT_DEVICE_DEVICEERRORS_HPP
#define INCLUDE_WIPECERT_DEVICE_DEVICEERRORS_HPP

#include "wipecert/core/Errors.hpp"
#include <stdexcept>
#include <string>

namespace wipecert::device
{

class DeviceError : public std::runtime_error
{
public:
    DeviceError(wipecert::core::ErrorKind kind, const std::string& what)
        : std::runtime_error{ what }, m_kind{ kind }
    {
    }

    [[nodiscard]] wipecert::core::ErrorKind kind() const noexcept
    {
        return m_kind;
    }

private:
    wipecert::core::ErrorKind m_kind;
};

class DeviceNotFound final : public DeviceError
{
public:
    explicit DeviceNotFound(const std::string& what) : DeviceError{ wipecert::core::ErrorKind::DeviceNotFound, what }
    {
    }
};

class PermissionDenied final : public DeviceError
{
public:
    explicit PermissionDenied(const std::string& what)
        : DeviceError{ wipecert::core::ErrorKind::PermissionDenied, what }
    {
    }
};

class SecureEraseNotSupported final : public DeviceError
{
public:
    explicit SecureEraseNotSupported(const std::string& what)
        : DeviceError{ wipecert::core::ErrorKind::SecureEraseNotSupported, what }
    {
    }
};

class HiddenAreaAccessFailed final : public DeviceError
{
public:
    explicit HiddenAreaAccessFailed(const std::string& what)
        : DeviceError{ wipecert::core::ErrorKind::HiddenAreaAccessFailed, what }
    {
    }
};

class UnsupportedDeviceType final : public DeviceError
{
public:
    explicit UnsupportedDeviceType(const std::string& what)
        : DeviceError{ wipecert::core::ErrorKind::UnsupportedDeviceType, what }
    {
    }
};

class UnsupportedPlatform final : public DeviceError
{
public:
    explicit UnsupportedPlatform(const std::string& what)
        : DeviceError{ wipecert::core::ErrorKind::UnsupportedPlatform, what }
    {
    }
};

} // namespace wipecert::device

#endif // INCLUDE_WIPECERT_DEVICE_DEVICEERRORS_HPP
