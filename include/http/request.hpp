#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include <vector>
#include <utility>

namespace http {

using header = std::pair<std::string, std::string>;
using header_list = std::vector<header>;

enum class parse_status
{
    complete,   /// start line and headers terminated by an empty line
    partial     /// data ends before the terminating empty line
};

/// Splits off the first line of text. Lines end in "\r\n" or a bare "\n"; line excludes the
/// terminator and consumed includes it. Returns false if text holds no complete line.
bool next_line(std::string_view text, std::string_view& line, size_t& consumed);

/// Parses the header block following a start line. Returns the number of bytes consumed
/// including the empty line, or 0 if the block is not terminated yet.
/// Throws std::invalid_argument on malformed header lines.
size_t parse_headers(std::string_view block, header_list& headers);

/// Case insensitive lookup of the last header named key
const std::string* find_header(const header_list& headers, std::string_view key);

bool iequals(std::string_view lhs, std::string_view rhs);

class request {

public:

    request() = default;

    explicit request(std::string_view request_string);

    parse_status parse(std::string_view request);

    const header_list& get_headers() const { return m_headers; }

    std::string get_header(std::string_view key) const;

    const std::string& get_method() const { return m_method; }

    const std::string& get_path() const { return m_path; }

    const std::string& get_protocol() const { return m_protocol; }

private:

    void parse_requestline(std::string_view requestline);

    std::string m_method;     /// method used by this request (e.g. M-SEARCH, NOTIFY, ...)
    std::string m_path;       /// request target, "*" for SSDP
    std::string m_protocol;   /// protocol of this request - should be HTTP/*.*

    header_list m_headers;    /// names and values of the request headers in arrival order

};

} // namespace http

#endif
