#include "wipecert/core/DeviceLockRegistry.hpp"
#include <utility>

namespace wipecert::core
{

DeviceLockRegistry::Lease::Lease(DeviceLockRegistry* owner, std::string path) noexcept
    : m_owner{ owner }, m_path{ std::move(path) }
{
}

DeviceLockRegistry::Lease::Lease(Lease&& other) noexcept
    : m_owner{ std::exchange(other.m_owner, nullptr) }, m_path{ std::move(other.m_path) }
{
}

DeviceLockRegistry::Lease& DeviceLockRegistry::Lease::operator=(Lease&& other) noexcept
{
    if (this != &other)
    {
        release();
        m_owner = std::exchange(other.m_owner, nullptr);
        m_path = std::move(other.m_path);
    }
    return *this;
}

DeviceLockRegistry::Lease::~Lease()
{
    release();
}

void DeviceLockRegistry::Lease::release() noexcept
{
    if (m_owner != nullptr)
    {
        m_owner->unlock(m_path);
        m_owner = nullptr;
    }
}

std::optional<DeviceLockRegistry::Lease> DeviceLockRegistry::tryAcquire(const std::string& path)
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    if (!m_locked.insert(path).second)
    {
        return std::nullopt;
    }
    return Lease{ this, path };
}

bool DeviceLockRegistry::isLocked(const std::string& path) const
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    return m_locked.contains(path);
}

void DeviceLockRegistry::unlock(const std::string& path) noexcept
{
    const std::lock_guard<std::mutex> lock{ m_mutex };
    m_locked.erase(path);
}

} // namespace wipecert::core
