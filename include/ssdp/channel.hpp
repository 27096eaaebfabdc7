#ifndef SSDP_CHANNEL_HPP
#define SSDP_CHANNEL_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ssdp
{

struct endpoint
{
    std::string addr;
    uint16_t port;
};

struct datagram
{
    std::string payload;
    endpoint peer;
};

// Bidirectional datagram channel shared by every activity of a server.
// Sends may be issued concurrently from several threads, receive is only called by the dispatch loop.
class datagram_channel
{
public:
    virtual ~datagram_channel() = default;

    /// Waits up to timeout for the next datagram, returns std::nullopt if none arrived.
    /// Throws std::runtime_error if the channel is no longer usable.
    virtual std::optional<datagram> receive(size_t max_size, std::chrono::milliseconds timeout) = 0;

    /// Throws std::runtime_error if the datagram could not be sent
    virtual void send_to(const endpoint& peer, std::string_view payload) = 0;
};

} // namespace ssdp

#endif
