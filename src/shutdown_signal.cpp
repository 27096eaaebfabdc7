#include "ssdp/shutdown_signal.hpp"

namespace ssdp
{

void shutdown_signal::fire()
{
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_fired = true;
    }
    m_cond.notify_all();
}

bool shutdown_signal::fired() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_fired;
}

void shutdown_signal::wait() const
{
    std::unique_lock<std::mutex> lock {m_mutex};
    m_cond.wait(lock, [this]() { return m_fired; });
}

} // namespace ssdp
