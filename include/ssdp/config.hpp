#ifndef SSDP_CONFIG_HPP
#define SSDP_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "http/request.hpp"
#include "ssdp/device.hpp"

namespace ssdp
{

#define SSDP_MULTICAST_ADDR "239.255.255.250"
#define SSDP_PORT 1900
#define SSDP_DEFAULT_SERVER_NAME "ssdpd/1.0 UPnP/1.0"
#define SSDP_DEFAULT_MAX_AGE 100

// Largest datagram the dispatch loop reads in one go
constexpr size_t max_datagram_size = 2048;

// Upper bound for max_age, one day. Larger values would not fit the alive loop's timer.
constexpr uint64_t max_age_limit = 86400;

class config_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Options shared read-only by every activity of a running server
struct server_config
{
    std::string server_name {SSDP_DEFAULT_SERVER_NAME};
    uint64_t max_age = SSDP_DEFAULT_MAX_AGE;
    http::header_list extra_headers;
    bool partial_request_workaround = false;

    // Pause between two broadcast sends to avoid bursts on the multicast link
    std::chrono::milliseconds announce_interval {50};

    // Search replies wait at most this long regardless of the client's MX
    std::chrono::seconds max_search_delay {3};
};

// Everything the daemon reads from its configuration file
struct daemon_config
{
    std::string interface {"0.0.0.0"};
    std::string log_level {"info"};
    server_config server;
    std::vector<device> devices;
};

/// Reads a JSON configuration file. Throws config_error if the file can not be read or
/// does not describe a valid configuration.
daemon_config load_config(const std::string& path);

/// Same as load_config but from an in-memory JSON document
daemon_config parse_config(const std::string& json_text);

} // namespace ssdp

#endif
