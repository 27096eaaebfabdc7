#ifndef SSDP_RESPONDER_HPP
#define SSDP_RESPONDER_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "ssdp/channel.hpp"
#include "ssdp/config.hpp"
#include "ssdp/device.hpp"
#include "ssdp/search_request.hpp"

namespace ssdp
{

/// Random delay before answering a search with the given MX.
/// Zero for MX 0, otherwise uniformly drawn from [0, min(mx, cap)) whole seconds.
std::chrono::seconds reply_delay(uint32_t mx, std::chrono::seconds cap);

class search_responder
{
public:

    search_responder(std::shared_ptr<const server_config> conf, std::shared_ptr<const device_registry> devices,
        std::shared_ptr<const std::string> extra_headers, std::shared_ptr<datagram_channel> channel);

    /// Answers the search if a device matches its ST. The reply is sent from a detached
    /// thread after a random delay so the caller never blocks.
    /// Returns true if a reply was scheduled.
    bool respond(const search_request& search, const endpoint& peer) const;

private:

    std::shared_ptr<const server_config> m_conf;

    std::shared_ptr<const device_registry> m_devices;

    std::shared_ptr<const std::string> m_extra_headers;

    std::shared_ptr<datagram_channel> m_channel;

};

} // namespace ssdp

#endif
