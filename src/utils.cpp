#include <utils.hpp>

#include <array>
#include <bitset>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>

namespace utils
{

const char* error_msg = "Unable to get local ip address";

std::string get_local_ipaddr()
{
    ifaddrs* addrs;
    if (getifaddrs(&addrs))
        throw std::runtime_error {error_msg};

    std::string result;
    for (ifaddrs* curr_addr = addrs; curr_addr != nullptr && result.empty(); curr_addr = curr_addr->ifa_next)
    {
        // SSDP multicast is IPv4 only
        if(curr_addr->ifa_addr == nullptr || curr_addr->ifa_addr->sa_family != AF_INET)
            continue;

        std::bitset<sizeof(unsigned int) * 8> flags {curr_addr->ifa_flags};
        if (!flags.test(IFF_UP) || flags.test(IFF_LOOPBACK) || !flags.test(IFF_MULTICAST))
            continue;

        std::array<char, NI_MAXHOST> host;
        if(getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in), host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST) == 0)
            result = host.data();
    }

    freeifaddrs(addrs);
    if(result.empty())
        throw std::runtime_error {error_msg};

    return result;
}

} // utils
