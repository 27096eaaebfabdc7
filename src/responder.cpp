#include "ssdp/responder.hpp"

#include "ssdp/message.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace ssdp
{

std::chrono::seconds reply_delay(uint32_t mx, std::chrono::seconds cap)
{
    // UPnP advises clients to keep MX below 5, we cap lower so answers arrive quickly
    uint64_t upper = std::min<uint64_t>(mx, cap.count());
    if(upper == 0)
        return std::chrono::seconds {0};

    thread_local std::mt19937 rng {std::random_device {}()};
    std::uniform_int_distribution<uint64_t> dist {0, upper - 1};
    return std::chrono::seconds {dist(rng)};
}

search_responder::search_responder(std::shared_ptr<const server_config> conf, std::shared_ptr<const device_registry> devices,
    std::shared_ptr<const std::string> extra_headers, std::shared_ptr<datagram_channel> channel)
    : m_conf {std::move(conf)},
      m_devices {std::move(devices)},
      m_extra_headers {std::move(extra_headers)},
      m_channel {std::move(channel)}
{}

bool search_responder::respond(const search_request& search, const endpoint& peer) const
{
    spdlog::debug("ST={}, MX={}", search.st, search.mx);

    const device* dev = m_devices->find_by_target(search.st);
    if(!dev)
        return false;

    spdlog::debug("Matched {} at {}", dev->usn, dev->location);

    std::string response = format_search_response(*dev, *m_conf, *m_extra_headers);
    spdlog::trace("Response: {}", response);

    std::chrono::seconds delay = reply_delay(search.mx, m_conf->max_search_delay);

    try {
        std::thread {[channel = m_channel, response = std::move(response), peer, delay]()
        {
            if(delay.count() > 0)
                std::this_thread::sleep_for(delay);

            try {
                channel->send_to(peer, response);
            } catch(const std::runtime_error& e) {
                spdlog::error("Failed to send search response to {}:{}: {}", peer.addr, peer.port, e.what());
            }
        }}.detach();
    } catch(const std::system_error& e) {
        spdlog::error("Dropping search response to {}:{}: {}", peer.addr, peer.port, e.what());
        return false;
    }

    return true;
}

} // namespace ssdp
