#ifndef INCLUDE_WIPECERT_CORE_CANCELLATIONTOKEN_HPP
#define INCLUDE_WIPECERT_CORE_CANCELLATIONTOKEN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

namespace wipecert::core
{

// Thrown by device operations that observe a cancelled token mid-pass.
class OperationCancelled final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Cooperative cancellation shared between the thread running a wipe and whoever may stop it.
class CancellationToken final
{
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;
    CancellationToken(CancellationToken&&) = delete;
    CancellationToken& operator=(CancellationToken&&) = delete;
    ~CancellationToken() = default;

    void cancel() noexcept;
    [[nodiscard]] bool isCancelled() const noexcept;

    // Sleeps up to `duration`. Returns false when woken by cancel().
    [[nodiscard]] bool waitFor(std::chrono::milliseconds duration) const;

    // Throws OperationCancelled when cancelled.
    void throwIfCancelled() const;

private:
    std::atomic<bool> m_cancelled{ false };
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
};

} // namespace wipecert::core

#endif // INCLUDE_WIPECERT_CORE_CANCELLATIONTOKEN_HPP
