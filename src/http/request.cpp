#include "http/request.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace http
{

static bool is_ws(char c)
{
    return c == ' ' || c == '\t';
}

static std::string_view trim(std::string_view view)
{
    while(!view.empty() && is_ws(view.front()))
        view.remove_prefix(1);
    while(!view.empty() && is_ws(view.back()))
        view.remove_suffix(1);
    return view;
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

bool next_line(std::string_view text, std::string_view& line, size_t& consumed)
{
    size_t end_pos = text.find('\n');
    if(end_pos == std::string_view::npos)
        return false;

    line = text.substr(0, end_pos);
    if(!line.empty() && line.back() == '\r')
        line.remove_suffix(1);
    consumed = end_pos + 1;
    return true;
}

size_t parse_headers(std::string_view block, header_list& headers)
{
    size_t start_pos = 0;
    while(true)
    {
        std::string_view headerline;
        size_t consumed = 0;
        if(!next_line(block.substr(start_pos), headerline, consumed))
            return 0;

        // Empty line terminates the header block
        if(headerline.empty())
            return start_pos + consumed;

        size_t mid_pos = headerline.find(':');
        if(mid_pos == std::string_view::npos)
            throw std::invalid_argument {"invalid_headerline"};

        std::string_view name = headerline.substr(0, mid_pos);
        if(name.empty() || std::any_of(name.begin(), name.end(), is_ws))
            throw std::invalid_argument {"invalid_headername"};

        headers.emplace_back(std::string {name}, std::string {trim(headerline.substr(mid_pos + 1))});
        start_pos += consumed;
    }
}

const std::string* find_header(const header_list& headers, std::string_view key)
{
    auto it = std::find_if(headers.rbegin(), headers.rend(), [key](const header& h) {
        return iequals(h.first, key);
    });

    return (it != headers.rend()) ? &it->second : nullptr;
}

request::request(std::string_view unparsed_request)
{
    if(parse(unparsed_request) != parse_status::complete)
        throw std::invalid_argument {"incomplete_request"};
}

parse_status request::parse(std::string_view request)
{
    m_headers.clear();

    /* extract the request line */
    std::string_view requestline;
    size_t consumed = 0;
    if(!next_line(request, requestline, consumed))
        return parse_status::partial;
    this->parse_requestline(requestline);

    /* Read and parse request headers */
    header_list headers;
    if(parse_headers(request.substr(consumed), headers) == 0)
        return parse_status::partial;

    m_headers = std::move(headers);
    return parse_status::complete;
}

void request::parse_requestline(std::string_view requestline)
{
    size_t first = requestline.find(' ');
    size_t second = (first == std::string_view::npos) ? first : requestline.find(' ', first + 1);
    if(first == 0 || second == std::string_view::npos || second == first + 1)
        throw std::invalid_argument {"invalid_requestline"};

    std::string_view protocol = requestline.substr(second + 1);
    if(protocol.substr(0, 5) != "HTTP/" || protocol.find(' ') != std::string_view::npos)
        throw std::invalid_argument {"invalid_protocol"};

    this->m_method = std::string {requestline.substr(0, first)};
    this->m_path = std::string {requestline.substr(first + 1, second - first - 1)};
    this->m_protocol = std::string {protocol};
}

std::string request::get_header(std::string_view key) const
{
    const std::string* value = find_header(m_headers, key);
    return value ? *value : "";
}

} // namespace http
