#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <string>
#include <string_view>

#include <http/request.hpp>

namespace http
{

class response
{
public:

    response() = default;

    explicit response(std::string_view response_string);

    parse_status parse(std::string_view response);

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_phrase() const
    {
        return m_phrase;
    }

    const std::string& get_protocol() const
    {
        return m_protocol;
    }

    const header_list& get_headers() const
    {
        return m_headers;
    }

    std::string get_header(std::string_view key) const;

private:

    void parse_statusline(std::string_view statusline);

    std::string m_protocol;
    int m_code = 0;
    std::string m_phrase;

    header_list m_headers;

};

} // namespace http

#endif
