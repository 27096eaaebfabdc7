#include "ssdp/message.hpp"

#include "fmt/format.h"
#include "fmt/chrono.h"

#include <ctime>

namespace ssdp
{

static constexpr const char* nts_alive = "ssdp:alive";

// Kept identical to the alive value, clients in the field rely on it
static constexpr const char* nts_byebye = nts_alive;

std::string render_headers(const http::header_list& headers)
{
    std::string rendered;
    for(const auto& it : headers)
        rendered += fmt::format("{}: {}\r\n", it.first, it.second);
    return rendered;
}

std::string format_http_date(std::chrono::system_clock::time_point time)
{
    static constexpr const char* days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    // Day and month names must not depend on the process locale
    std::tm tm = fmt::gmtime(std::chrono::system_clock::to_time_t(time));
    return fmt::format("{}, {:02} {} {:04} {:02}:{:02}:{:02} GMT", days[tm.tm_wday], tm.tm_mday, months[tm.tm_mon],
        tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
}

std::string format_search_response(const device& dev, const server_config& conf, std::string_view extra_headers,
    std::chrono::system_clock::time_point now)
{
    return fmt::format(
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age={}\r\n"
        "DATE: {}\r\n"
        "EXT:\r\n"
        "LOCATION: {}\r\n"
        "SERVER: {}\r\n"
        "ST: {}\r\n"
        "USN: {}\r\n"
        "{}"
        "\r\n",
        conf.max_age,
        format_http_date(now),
        dev.location,
        conf.server_name,
        dev.search_target,
        dev.usn,
        extra_headers
    );
}

std::string format_alive(const device& dev, const server_config& conf, std::string_view extra_headers)
{
    return fmt::format(
        "NOTIFY * HTTP/1.1\r\n"
        "HOST: {}:{}\r\n"
        "CACHE-CONTROL: max-age={}\r\n"
        "LOCATION: {}\r\n"
        "NT: {}\r\n"
        "NTS: {}\r\n"
        "SERVER: {}\r\n"
        "USN: {}\r\n"
        "{}"
        "\r\n",
        SSDP_MULTICAST_ADDR, SSDP_PORT,
        conf.max_age,
        dev.location,
        dev.search_target,
        nts_alive,
        conf.server_name,
        dev.usn,
        extra_headers
    );
}

std::string format_byebye(const device& dev, const server_config&, std::string_view extra_headers)
{
    return fmt::format(
        "NOTIFY * HTTP/1.1\r\n"
        "HOST: {}:{}\r\n"
        "NT: {}\r\n"
        "NTS: {}\r\n"
        "USN: {}\r\n"
        "{}"
        "\r\n",
        SSDP_MULTICAST_ADDR, SSDP_PORT,
        dev.search_target,
        nts_byebye,
        dev.usn,
        extra_headers
    );
}

} // namespace ssdp
