#ifndef SSDP_SERVER_HPP
#define SSDP_SERVER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "ssdp/channel.hpp"
#include "ssdp/config.hpp"
#include "ssdp/device.hpp"
#include "ssdp/shutdown_signal.hpp"

namespace ssdp
{

/// SSDP responder for a fixed set of devices.
///
/// Answers M-SEARCH requests for the registered search targets, announces every device
/// with ssdp:alive every max_age seconds and sends a byebye round when shut down.
///
///     ssdp::server srv {{
///         ssdp::device {uuid, "upnp:rootdevice", "http://192.168.1.100:8080/desc.xml"},
///         ssdp::device {uuid, "", "http://192.168.1.100:8080/desc.xml"}
///     }};
///     srv.server_name("SomeDevice/1.0 UPnP/1.0").extra_header("CONFIGID.UPNP.ORG", "1");
///     srv.serve("192.168.1.100");
class server
{
public:

    server() = delete;
    server(const server&) = delete;
    server& operator=(const server&) = delete;
    server(server&&) = delete;
    server& operator=(server&&) = delete;
    ~server() = default;

    explicit server(std::vector<device> devices, server_config conf = {});

    /// Value of the SERVER header, defaults to SSDP_DEFAULT_SERVER_NAME
    server& server_name(std::string name);

    /// Value of CACHE-CONTROL: max-age= and the alive interval in seconds, defaults to 100.
    /// Throws std::invalid_argument unless 0 < seconds <= max_age_limit.
    server& max_age(uint64_t seconds);

    /// Header appended to every outgoing message
    server& extra_header(std::string name, std::string value);

    /// Accept requests that end in a single "\r\n"
    server& partial_request_workaround(bool enabled);

    server& announce_interval(std::chrono::milliseconds interval);

    server& max_search_delay(std::chrono::seconds delay);

    /// Opens the SSDP socket on the interface with address interface_ip and serves until
    /// shutdown() is called. Throws std::runtime_error if the socket can not be set up
    /// or fails while serving.
    void serve(const std::string& interface_ip = "0.0.0.0");

    /// Serves on an already opened channel. Blocks until shutdown() is called or the channel
    /// fails; in both cases the byebye round has been sent when this returns.
    void serve(std::shared_ptr<datagram_channel> channel);

    /// Stops serving. Safe to call from any thread and more than once.
    void shutdown();

    const server_config& config() const { return m_conf; }

private:

    server_config m_conf;

    std::vector<device> m_devices;

    shutdown_signal m_shutdown;

    std::atomic<bool> m_served {false};

};

} // namespace ssdp

#endif
