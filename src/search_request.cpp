#include "ssdp/search_request.hpp"

#include <spdlog/spdlog.h>

#include <charconv>

namespace ssdp
{

bool apply_partial_request_workaround(std::string& payload, size_t capacity)
{
    std::string_view view {payload};
    bool single_crlf = view.size() >= 2 && view.substr(view.size() - 2) == "\r\n" &&
        (view.size() < 4 || view.substr(view.size() - 4) != "\r\n\r\n");

    if(!single_crlf || capacity < 2 || payload.size() >= capacity - 2)
        return false;

    payload += "\r\n";
    return true;
}

interpreted_request interpret_datagram(std::string_view payload)
{
    interpreted_request result;

    try {
        if(result.req.parse(payload) != http::parse_status::complete)
        {
            spdlog::trace("Dropping incomplete datagram ({} bytes)", payload.size());
            return result;
        }
    } catch(const std::invalid_argument& e) {
        spdlog::trace("Dropping malformed datagram: {}", e.what());
        return result;
    }

    const std::string& method = result.req.get_method();
    const std::string& path = result.req.get_path();
    if(method.empty() || path.empty())
        return result;

    if(method == "M-SEARCH" && path == "*")
        result.kind = request_kind::search;
    else if(method == "NOTIFY" && path == "*")
        result.kind = request_kind::notify;
    else
        result.kind = request_kind::unknown;

    return result;
}

search_request parse_search_request(const http::request& req)
{
    search_request search;
    bool st_found = false;
    bool man_found = false;

    for(const auto& [name, value] : req.get_headers())
    {
        if(http::iequals(name, "ST"))
        {
            search.st = value;
            st_found = true;
        }
        else if(http::iequals(name, "MX"))
        {
            auto res = std::from_chars(value.data(), value.data() + value.size(), search.mx);
            if(res.ec != std::errc {} || res.ptr != value.data() + value.size())
                throw invalid_search_request {"MX is not an unsigned integer (" + value + ")"};
        }
        else if(http::iequals(name, "MAN"))
        {
            if(value != "\"ssdp:discover\"")
                throw invalid_search_request {"MAN != \"ssdp:discover\" (" + value + ")"};
            man_found = true;
        }
    }

    if(!man_found)
        throw invalid_search_request {"MAN header not found"};

    if(!st_found)
        throw invalid_search_request {"ST header not found"};

    return search;
}

} // namespace ssdp
