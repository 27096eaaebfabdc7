#ifndef SSDP_SEARCH_REQUEST_HPP
#define SSDP_SEARCH_REQUEST_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "http/request.hpp"

namespace ssdp
{

enum class request_kind
{
    dropped,    // incomplete or malformed, or no method/path
    search,     // M-SEARCH *
    notify,     // NOTIFY * from another device
    unknown     // anything else
};

struct interpreted_request
{
    request_kind kind = request_kind::dropped;
    http::request req;
};

// Parameters of a valid M-SEARCH
struct search_request
{
    std::string st;
    uint32_t mx = 0;
};

// A search that parsed fine but violates the SSDP rules (ST, MX or MAN)
class invalid_search_request : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

/// Some broken clients end their request in a single "\r\n" instead of "\r\n\r\n".
/// Appends the missing line break if there is room left in a buffer of the given capacity.
/// Returns true if the payload was modified.
bool apply_partial_request_workaround(std::string& payload, size_t capacity);

/// Parses a datagram and classifies it by method and path. Never throws, unparseable
/// datagrams come back as request_kind::dropped.
interpreted_request interpret_datagram(std::string_view payload);

/// Extracts ST and MX from an M-SEARCH and checks the MAN header.
/// Throws invalid_search_request if one of them is missing or wrong.
search_request parse_search_request(const http::request& req);

} // namespace ssdp

#endif
