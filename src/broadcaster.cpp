#include "ssdp/broadcaster.hpp"

#include "ssdp/message.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace ssdp
{

broadcaster::broadcaster(std::shared_ptr<const server_config> conf, std::shared_ptr<const device_registry> devices,
    std::shared_ptr<const std::string> extra_headers, std::shared_ptr<datagram_channel> channel)
    : m_conf {std::move(conf)},
      m_devices {std::move(devices)},
      m_extra_headers {std::move(extra_headers)},
      m_channel {std::move(channel)},
      m_group {SSDP_MULTICAST_ADDR, SSDP_PORT}
{}

void broadcaster::run_alive_loop(const shutdown_signal& shutdown) const
{
    enum class state { announcing, waiting, shutting_down };

    const std::chrono::seconds period {static_cast<std::chrono::seconds::rep>(std::min(m_conf->max_age, max_age_limit))};

    state current = state::announcing;
    while(current != state::shutting_down)
    {
        switch(current)
        {
        case state::announcing:
            try {
                broadcast_alive(&shutdown);
            } catch(const std::runtime_error& e) {
                spdlog::error("Send alive messages failed: {}", e.what());
            }
            current = state::waiting;
            break;

        case state::waiting:
            if(shutdown.wait_for(period))
            {
                spdlog::debug("Alive loop shutting down");
                current = state::shutting_down;
            }
            else
            {
                current = state::announcing;
            }
            break;

        case state::shutting_down:
            break;
        }
    }
}

void broadcaster::run_byebye_on_shutdown(const shutdown_signal& shutdown) const
{
    shutdown.wait();
    size_t sent = broadcast_byebye();
    spdlog::info("Sent {} of {} byebye messages", sent, m_devices->size());
}

void broadcaster::broadcast_alive(const shutdown_signal* shutdown) const
{
    spdlog::debug("Sending alive messages");

    std::lock_guard<std::mutex> lock {m_round_mutex};
    for(const device& dev : *m_devices)
    {
        if(shutdown && shutdown->fired())
            return;

        std::string message = format_alive(dev, *m_conf, *m_extra_headers);
        spdlog::trace("Alive message: {}", message);

        m_channel->send_to(m_group, message);

        // Avoid congestion
        std::this_thread::sleep_for(m_conf->announce_interval);
    }
}

size_t broadcaster::broadcast_byebye() const
{
    spdlog::debug("Sending byebye messages");

    // Waits for an alive round in flight, which stops once it sees the shutdown
    std::lock_guard<std::mutex> lock {m_round_mutex};
    size_t sent = 0;
    for(const device& dev : *m_devices)
    {
        std::string message = format_byebye(dev, *m_conf, *m_extra_headers);
        spdlog::trace("Byebye message: {}", message);

        try {
            m_channel->send_to(m_group, message);
            ++sent;
        } catch(const std::runtime_error& e) {
            spdlog::error("Send byebye message for {} failed: {}", dev.usn, e.what());
        }

        std::this_thread::sleep_for(m_conf->announce_interval);
    }

    return sent;
}

} // namespace ssdp
