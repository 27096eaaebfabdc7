#include <stdexcept>
#include <string>
#include <string_view>
#include <gtest/gtest.h>

#include "http/request.hpp"
#include "http/response.hpp"

TEST(http_request, ParseSearch)
{
    http::request req;
    http::parse_status status = req.parse(
        "M-SEARCH * HTTP/1.1\r\n"
        "HOST: 239.255.255.250:1900\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "MX: 2\r\n"
        "ST: upnp:rootdevice\r\n"
        "\r\n");

    ASSERT_EQ(http::parse_status::complete, status);
    ASSERT_EQ("M-SEARCH", req.get_method());
    ASSERT_EQ("*", req.get_path());
    ASSERT_EQ("HTTP/1.1", req.get_protocol());
    ASSERT_EQ(4u, req.get_headers().size());
    ASSERT_EQ("HOST", req.get_headers()[0].first);
    ASSERT_EQ("upnp:rootdevice", req.get_headers()[3].second);
}

TEST(http_request, HeaderLookupIgnoresCase)
{
    http::request req {"NOTIFY * HTTP/1.1\r\nnt: upnp:rootdevice\r\nNts: ssdp:alive\r\n\r\n"};

    ASSERT_EQ("upnp:rootdevice", req.get_header("NT"));
    ASSERT_EQ("ssdp:alive", req.get_header("nts"));
    ASSERT_EQ("ssdp:alive", req.get_header("NTS"));
    ASSERT_EQ(nullptr, http::find_header(req.get_headers(), "USN"));
    ASSERT_EQ("", req.get_header("USN"));
}

TEST(http_request, DuplicateHeadersKeepOrderAndLastWins)
{
    http::request req {"M-SEARCH * HTTP/1.1\r\nST: first\r\nst: second\r\n\r\n"};

    ASSERT_EQ(2u, req.get_headers().size());
    ASSERT_EQ("first", req.get_headers()[0].second);
    ASSERT_EQ("second", req.get_header("ST"));
}

TEST(http_request, ValueWhitespace)
{
    http::request req {"NOTIFY * HTTP/1.1\r\nEXT:\r\nA:no-space\r\nB:  padded \t\r\n\r\n"};

    ASSERT_EQ("", req.get_header("EXT"));
    ASSERT_NE(nullptr, http::find_header(req.get_headers(), "EXT"));
    ASSERT_EQ("no-space", req.get_header("A"));
    ASSERT_EQ("padded", req.get_header("B"));
}

TEST(http_request, Partial)
{
    http::request req;
    ASSERT_EQ(http::parse_status::partial, req.parse("M-SEARCH * HTTP/1.1"));
    ASSERT_EQ(http::parse_status::partial, req.parse("M-SEARCH * HTTP/1.1\r\nST: a\r\n"));
    ASSERT_EQ(http::parse_status::partial, req.parse("M-SEARCH * HTTP/1.1\r\nST: a"));
    ASSERT_THROW(http::request {"M-SEARCH * HTTP/1.1\r\nST: a\r\n"}, std::invalid_argument);
}

TEST(http_request, Invalid)
{
    http::request req;
    ASSERT_THROW(req.parse("GARBAGE\r\n\r\n"), std::invalid_argument);
    ASSERT_THROW(req.parse("M-SEARCH *\r\n\r\n"), std::invalid_argument);
    ASSERT_THROW(req.parse("M-SEARCH * FTP/1.0\r\n\r\n"), std::invalid_argument);
    ASSERT_THROW(req.parse("M-SEARCH  HTTP/1.1\r\n\r\n"), std::invalid_argument);
    ASSERT_THROW(req.parse("M-SEARCH * HTTP/1.1\r\nno colon here\r\n\r\n"), std::invalid_argument);
    ASSERT_THROW(req.parse("M-SEARCH * HTTP/1.1\r\n: empty name\r\n\r\n"), std::invalid_argument);
}

TEST(http_request, BareLineFeeds)
{
    http::request req;
    ASSERT_EQ(http::parse_status::complete, req.parse(
        "M-SEARCH * HTTP/1.1\n"
        "MAN: \"ssdp:discover\"\n"
        "MX: 1\r\n"
        "ST: upnp:rootdevice\n"
        "\n"));

    ASSERT_EQ("M-SEARCH", req.get_method());
    ASSERT_EQ("HTTP/1.1", req.get_protocol());
    ASSERT_EQ(3u, req.get_headers().size());
    ASSERT_EQ("\"ssdp:discover\"", req.get_header("MAN"));
    ASSERT_EQ("upnp:rootdevice", req.get_header("ST"));

    ASSERT_EQ(http::parse_status::partial, req.parse("M-SEARCH * HTTP/1.1\nST: a\n"));
}

TEST(http_next_line, Terminators)
{
    std::string_view line;
    size_t consumed = 0;

    ASSERT_TRUE(http::next_line("ST: a\r\nrest", line, consumed));
    ASSERT_EQ("ST: a", line);
    ASSERT_EQ(7u, consumed);

    ASSERT_TRUE(http::next_line("ST: a\nrest", line, consumed));
    ASSERT_EQ("ST: a", line);
    ASSERT_EQ(6u, consumed);

    ASSERT_TRUE(http::next_line("\r\n", line, consumed));
    ASSERT_TRUE(line.empty());
    ASSERT_EQ(2u, consumed);

    ASSERT_FALSE(http::next_line("ST: a\r", line, consumed));
}

TEST(http_response, ParseStatusLine)
{
    http::response res {"HTTP/1.1 200 OK\r\nCACHE-CONTROL: max-age=100\r\nEXT:\r\n\r\n"};

    ASSERT_EQ("HTTP/1.1", res.get_protocol());
    ASSERT_EQ(200, res.get_code());
    ASSERT_EQ("OK", res.get_phrase());
    ASSERT_EQ(2u, res.get_headers().size());
    ASSERT_EQ("max-age=100", res.get_header("cache-control"));
}

TEST(http_response, Invalid)
{
    http::response res;
    ASSERT_THROW(res.parse("NOTIFY * HTTP/1.1\r\n\r\n"), std::invalid_argument);
    ASSERT_THROW(res.parse("HTTP/1.1 abc OK\r\n\r\n"), std::invalid_argument);
    ASSERT_THROW(res.parse("HTTP/1.1 2000 OK\r\n\r\n"), std::invalid_argument);
    ASSERT_EQ(http::parse_status::partial, res.parse("HTTP/1.1 200 OK\r\nEXT:\r\n"));
}

TEST(http_response, BareLineFeeds)
{
    http::response res {"HTTP/1.1 200 OK\nST: upnp:rootdevice\n\n"};

    ASSERT_EQ(200, res.get_code());
    ASSERT_EQ("upnp:rootdevice", res.get_header("ST"));
}

int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
