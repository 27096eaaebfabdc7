#ifndef SSDP_SHUTDOWN_SIGNAL_HPP
#define SSDP_SHUTDOWN_SIGNAL_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ssdp
{

// One-shot signal observed by any number of waiters. Firing it wakes all of them and
// every later wait returns immediately.
class shutdown_signal
{
public:

    shutdown_signal() = default;
    shutdown_signal(const shutdown_signal&) = delete;
    shutdown_signal& operator=(const shutdown_signal&) = delete;

    void fire();

    bool fired() const;

    void wait() const;

    /// Returns true if the signal fired before the timeout elapsed
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const
    {
        std::unique_lock<std::mutex> lock {m_mutex};
        return m_cond.wait_for(lock, timeout, [this]() { return m_fired; });
    }

private:

    mutable std::mutex m_mutex;

    mutable std::condition_variable m_cond;

    bool m_fired = false;

};

} // namespace ssdp

#endif
