#ifndef SSDP_BROADCASTER_HPP
#define SSDP_BROADCASTER_HPP

#include <memory>
#include <mutex>
#include <string>

#include "ssdp/channel.hpp"
#include "ssdp/config.hpp"
#include "ssdp/device.hpp"
#include "ssdp/shutdown_signal.hpp"

namespace ssdp
{

// Multicast announcements of the whole registry: periodic ssdp:alive and the byebye round on shutdown
class broadcaster
{
public:

    broadcaster(std::shared_ptr<const server_config> conf, std::shared_ptr<const device_registry> devices,
        std::shared_ptr<const std::string> extra_headers, std::shared_ptr<datagram_channel> channel);

    /// Announces every device, then waits max_age seconds (at most max_age_limit) and starts over until the signal fires.
    /// Sends no byebye.
    void run_alive_loop(const shutdown_signal& shutdown) const;

    /// Blocks until the signal fires, then sends one byebye round
    void run_byebye_on_shutdown(const shutdown_signal& shutdown) const;

    /// One alive per device in registration order. Stops at the first failed send and
    /// throws its std::runtime_error. Stops early once shutdown fired, if given.
    void broadcast_alive(const shutdown_signal* shutdown = nullptr) const;

    /// One byebye per device in registration order. Failed sends are logged and skipped.
    /// Starts after a concurrent alive round has finished.
    /// Returns the number of messages sent.
    size_t broadcast_byebye() const;

private:

    std::shared_ptr<const server_config> m_conf;

    std::shared_ptr<const device_registry> m_devices;

    std::shared_ptr<const std::string> m_extra_headers;

    std::shared_ptr<datagram_channel> m_channel;

    endpoint m_group;

    // Alive and byebye rounds never interleave
    mutable std::mutex m_round_mutex;

};

} // namespace ssdp

#endif
