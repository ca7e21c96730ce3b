#ifndef INCLUDE_WIPECERT_CORE_DEVICELOCKREGISTRY_HPP
#define INCLUDE_WIPECERT_CORE_DEVICELOCKREGISTRY_HPP

#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace wipecert::core
{

// In-process exclusion keyed by device path.
class DeviceLockRegistry final
{
public:
    // Releases the path on destruction. Movable, not copyable.
    class Lease final
    {
    public:
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        [[nodiscard]] const std::string& path() const noexcept
        {
            return m_path;
        }

    private:
        friend class DeviceLockRegistry;
        Lease(DeviceLockRegistry* owner, std::string path) noexcept;
        void release() noexcept;

        DeviceLockRegistry* m_owner{ nullptr };
        std::string m_path;
    };

    DeviceLockRegistry() = default;
    DeviceLockRegistry(const DeviceLockRegistry&) = delete;
    DeviceLockRegistry& operator=(const DeviceLockRegistry&) = delete;
    DeviceLockRegistry(DeviceLockRegistry&&) = delete;
    DeviceLockRegistry& operator=(DeviceLockRegistry&&) = delete;
    ~DeviceLockRegistry() = default;

    // std::nullopt while another lease for the same path is alive.
    [[nodiscard]] std::optional<Lease> tryAcquire(const std::string& path);

    [[nodiscard]] bool isLocked(const std::string& path) const;

private:
    void unlock(const std::string& path) noexcept;

    mutable std::mutex m_mutex;
    std::set<std::string> m_locked;
};

} // namespace wipecert::core

#endif // INCLUDE_WIPECERT_CORE_DEVICELOCKREGISTRY_HPP
