#include "wipecert/core/CancellationToken.hpp"

namespace wipecert::core
{

void CancellationToken::cancel() noexcept
{
    {
        const std::lock_guard<std::mutex> lock{ m_mutex };
        m_cancelled.store(true, std::memory_order_release);
    }
    m_cv.notify_all();
}

bool CancellationToken::isCancelled() const noexcept
{
    return m_cancelled.load(std::memory_order_acquire);
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const
{
    std::unique_lock<std::mutex> lock{ m_mutex };
    const bool cancelled{ m_cv.wait_for(lock, duration,
                                        [this] { return m_cancelled.load(std::memory_order_acquire); }) };
    return !cancelled;
}

void CancellationToken::throwIfCancelled() const
{
    if (isCancelled())
    {
        throw OperationCancelled{ "operation cancelled" };
    }
}

} // namespace wipecert::core
