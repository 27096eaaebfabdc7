#ifndef SSDP_UDP_CHANNEL_HPP
#define SSDP_UDP_CHANNEL_HPP

#include <string>

#include "socketwrapper.hpp"

#include "ssdp/channel.hpp"

namespace ssdp
{

// UDP socket bound to the SSDP port and joined to the SSDP multicast group
class udp_channel : public datagram_channel
{
public:

    udp_channel() = delete;
    udp_channel(const udp_channel&) = delete;
    udp_channel& operator=(const udp_channel&) = delete;
    udp_channel(udp_channel&&) = delete;
    udp_channel& operator=(udp_channel&&) = delete;
    ~udp_channel() override = default;

    /// Binds 0.0.0.0:1900 and joins 239.255.255.250 on the interface with address interface_ip.
    /// Throws std::runtime_error if the socket can not be set up.
    explicit udp_channel(const std::string& interface_ip);

    std::optional<datagram> receive(size_t max_size, std::chrono::milliseconds timeout) override;

    void send_to(const endpoint& peer, std::string_view payload) override;

private:

    net::udp_socket<net::ip_version::v4> m_sock;

};

} // namespace ssdp

#endif
