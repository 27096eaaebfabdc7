#include <http/response.hpp>

#include <charconv>
#include <stdexcept>

namespace http
{

response::response(std::string_view unparsed_response)
{
    if(parse(unparsed_response) != parse_status::complete)
        throw std::invalid_argument {"incomplete_response"};
}

parse_status response::parse(std::string_view response)
{
    m_headers.clear();

    std::string_view statusline;
    size_t consumed = 0;
    if(!next_line(response, statusline, consumed))
        return parse_status::partial;
    this->parse_statusline(statusline);

    header_list headers;
    if(parse_headers(response.substr(consumed), headers) == 0)
        return parse_status::partial;

    m_headers = std::move(headers);
    return parse_status::complete;
}

std::string response::get_header(std::string_view key) const
{
    const std::string* value = find_header(m_headers, key);
    return value ? *value : "";
}

void response::parse_statusline(std::string_view statusline)
{
    size_t first = statusline.find(' ');
    if(first == std::string_view::npos || statusline.substr(0, 5) != "HTTP/")
        throw std::invalid_argument {"invalid_statusline"};

    std::string_view rest = statusline.substr(first + 1);
    size_t second = rest.find(' ');
    std::string_view code_view = rest.substr(0, second);

    int code = 0;
    auto res = std::from_chars(code_view.data(), code_view.data() + code_view.size(), code);
    if(res.ec != std::errc {} || res.ptr != code_view.data() + code_view.size() || code_view.size() != 3)
        throw std::invalid_argument {"invalid_statuscode"};

    m_protocol = std::string {statusline.substr(0, first)};
    m_code = code;
    m_phrase = (second == std::string_view::npos) ? std::string {} : std::string {rest.substr(second + 1)};
}

} // namespace http
