#include "ssdp/udp_channel.hpp"

#include "ssdp/config.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>
#include <poll.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace ssdp
{

static void set_option(int fd, int level, int name, const void* value, socklen_t len, const char* what)
{
    if(::setsockopt(fd, level, name, value, len) != 0)
        throw std::runtime_error {std::string {"Failed to "} + what + ": " + std::strerror(errno)};
}

udp_channel::udp_channel(const std::string& interface_ip)
    : m_sock {"0.0.0.0", SSDP_PORT}
{
    in_addr iface {};
    if(::inet_pton(AF_INET, interface_ip.c_str(), &iface) != 1)
        throw std::runtime_error {"Invalid interface address " + interface_ip};

    ip_mreq mreq {};
    ::inet_pton(AF_INET, SSDP_MULTICAST_ADDR, &mreq.imr_multiaddr);
    mreq.imr_interface = iface;
    set_option(m_sock.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq), "join multicast group");

    unsigned char loop = 1;
    set_option(m_sock.get(), IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop), "enable multicast loopback");

    // Notifications leave through the joined interface instead of the default route
    if(iface.s_addr != htonl(INADDR_ANY))
        set_option(m_sock.get(), IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface), "select multicast interface");

    spdlog::info("Listening on 0.0.0.0:{} (multicast {} via {})", SSDP_PORT, SSDP_MULTICAST_ADDR, interface_ip);
}

std::optional<datagram> udp_channel::receive(size_t max_size, std::chrono::milliseconds timeout)
{
    pollfd pfd {m_sock.get(), POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if(ready < 0)
    {
        if(errno == EINTR)
            return std::nullopt;
        throw std::runtime_error {std::string {"poll failed: "} + std::strerror(errno)};
    }
    if(ready == 0)
        return std::nullopt;

    if(pfd.revents & (POLLERR | POLLNVAL))
        throw std::runtime_error {"SSDP socket closed"};

    std::vector<char> buffer(max_size);
    auto [bytes_read, peer] = m_sock.read(net::span {buffer.data(), buffer.size()});

    return datagram {std::string {buffer.data(), bytes_read}, endpoint {peer.addr, peer.port}};
}

void udp_channel::send_to(const endpoint& peer, std::string_view payload)
{
    m_sock.send(peer.addr, peer.port, net::span {payload.data(), payload.size()});
}

} // namespace ssdp
