#ifndef SSDP_MESSAGE_HPP
#define SSDP_MESSAGE_HPP

#include <chrono>
#include <string>
#include <string_view>

#include "http/request.hpp"
#include "ssdp/config.hpp"
#include "ssdp/device.hpp"

namespace ssdp
{

/// Renders headers as "NAME: value\r\n" lines, ready to be appended to a message
std::string render_headers(const http::header_list& headers);

/// RFC 1123 date as used by the DATE header, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string format_http_date(std::chrono::system_clock::time_point time);

/// Unicast answer to a matching M-SEARCH
std::string format_search_response(const device& dev, const server_config& conf, std::string_view extra_headers,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

/// Multicast ssdp:alive notification
std::string format_alive(const device& dev, const server_config& conf, std::string_view extra_headers);

/// Multicast notification sent for every device when the server shuts down.
/// NTS carries ssdp:alive here, as existing deployments of this server always did.
std::string format_byebye(const device& dev, const server_config& conf, std::string_view extra_headers);

} // namespace ssdp

#endif
