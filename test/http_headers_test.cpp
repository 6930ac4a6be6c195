#include "../net/http/header_utils.hpp"
#include "../net/http/http1_request_parser.hpp"
#include "../net/http/http1_response_parser.hpp"
#include "../net/http/http_common.hpp"
#include "../net/http/http_message.hpp"
#include "../net/http/upstream_client.hpp"

#include <cstdio>
#include <string>

using namespace convgate::net::http;

namespace {

int check(bool condition, const char* message)
{
    if (condition)
        return 0;
    std::fprintf(stderr, "[FAIL] %s\n", message);
    return 1;
}

} // namespace

int main()
{
    int failures = 0;

    // Case-insensitive accessors on HttpMessage
    HttpResponse response;
    response.set_status(200, "OK");
    response.set_header("Content-Type", "text/plain");
    response.set_header("X-CuStOm", "value");
    failures += check(response.has_header("content-type"), "Content-Type should exist regardless of case");
    failures += check(response.header("CONTENT-TYPE").value() == "text/plain", "header() must ignore case for lookup");
    response.remove_header("x-custom");
    failures += check(!response.has_header("X-CUSTOM"), "remove_header must be case insensitive");
    response.add_header("Set-Cookie", "a=1");
    response.add_header("set-cookie", "b=2");
    failures += check(response.header_values("SET-COOKIE").size() == 2, "repeated headers are kept in order");

    // URL handling
    auto https = parse_url("https://chat.openai.com/backend-api/models?x=1");
    failures += check(https.has_value(), "parse_url should succeed for https");
    failures += check(https && https->port == 443 && https->authority() == "chat.openai.com",
                      "default https port is omitted from the authority");
    failures += check(https && https->path == "/backend-api/models?x=1", "path keeps the query");
    auto http = parse_url("http://127.0.0.1:8080");
    failures += check(http && http->port == 8080 && http->path == "/", "explicit port and empty path");
    failures += check(http && http->authority() == "127.0.0.1:8080", "non-default port stays in the authority");
    failures += check(!parse_url("ftp://example.com/"), "only http and https are accepted");
    failures += check(!parse_url("chat.openai.com/path"), "scheme is required");

    std::string path;
    std::string query;
    split_target("/backend-api/conversation?a=1&b=2", path, query);
    failures += check(path == "/backend-api/conversation" && query == "a=1&b=2", "target split at '?'");
    split_target("", path, query);
    failures += check(path == "/" && query.empty(), "empty target becomes /");

    // Default header injection via build_http_request
    OutboundRequest post;
    post.method = "POST";
    post.url    = "https://example.com/path";
    post.body   = "payload";
    post.headers.push_back({ "Transfer-Encoding", "chunked" });
    auto url   = parse_url(post.url);
    auto built = build_http_request(post, *url, "agent/1");
    failures += check(header_exists(built.headers, "Host"), "Host header should be auto-populated");
    failures += check(find_header(built.headers, "user-agent") == std::string("agent/1"),
                      "User-Agent default should be injected");
    failures += check(find_header(built.headers, "Content-Length") == std::string("7"),
                      "Content-Length expected for body requests");
    failures += check(!header_exists(built.headers, "Transfer-Encoding"), "Transfer-Encoding is never forwarded");
    failures += check(find_header(built.headers, "connection") == std::string("close"), "one request per connection");
    failures += check(built.payload.rfind("POST /path HTTP/1.1\r\nHost: example.com\r\n", 0) == 0,
                      "request line then Host");
    failures += check(built.payload.size() > 7 && built.payload.compare(built.payload.size() - 11, 11, "\r\n\r\npayload") == 0,
                      "body follows the blank line");

    OutboundRequest empty_post;
    empty_post.method = "POST";
    empty_post.url    = "http://example.org/sentinel";
    empty_post.headers.push_back({ "Host", "override.example" });
    auto empty_url = parse_url(empty_post.url);
    auto empty     = build_http_request(empty_post, *empty_url, "agent/1");
    failures += check(find_header(empty.headers, "content-length") == std::string("0"), "bodyless POST sends length 0");
    failures += check(header_values(empty.headers, "host").size() == 1
                          && find_header(empty.headers, "host") == std::string("override.example"),
                      "caller supplied Host is kept");

    OutboundRequest get;
    get.url        = "http://example.org/data";
    auto get_url   = parse_url(get.url);
    auto get_built = build_http_request(get, *get_url, "agent/1");
    failures += check(!header_exists(get_built.headers, "Content-Length"), "GET without body has no Content-Length");

    Headers content { { "Content-Type", "a" }, { "content-length", "3" }, { "X-Keep", "1" } };
    remove_content_headers(content);
    failures += check(content.size() == 1 && content[0].name == "X-Keep", "content headers removed");

    // Request parsing
    Http1RequestParser request_parser;
    std::string        raw = "POST /backend-api/conversation?x=1 HTTP/1.1\r\n"
                             "Host: localhost\r\n"
                             "Authorization:  Bearer abc \r\n"
                             "Content-Length: 17\r\n"
                             "\r\n"
                             "{\"model\":\"gpt-4\"}";
    failures += check(request_parser.feed(raw.substr(0, 20)), "partial request accepted");
    failures += check(!request_parser.is_message_complete(), "partial request is not complete");
    failures += check(request_parser.feed(raw.substr(20)), "rest of request accepted");
    failures += check(request_parser.is_message_complete(), "request complete");
    auto parsed = request_parser.take_request();
    failures += check(parsed.method == "POST" && parsed.target == "/backend-api/conversation?x=1", "request line");
    failures += check(parsed.header("authorization") == std::string("Bearer abc"), "header value trimmed");
    failures += check(parsed.body == "{\"model\":\"gpt-4\"}", "request body buffered");

    Http1RequestParser limited;
    limited.set_max_body_bytes(4);
    std::string big   = "POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\n0123456789";
    std::string error;
    failures += check(!limited.feed(big, &error), "oversized body fails the parse");
    failures += check(limited.body_too_large() && error == "body too large", "oversize is reported as such");

    Http1RequestParser huge_headers;
    std::string        huge = "GET / HTTP/1.1\r\nX-Fill: " + std::string(70 * 1024, 'a') + "\r\n\r\n";
    failures += check(!huge_headers.feed(huge, &error), "oversized header block fails the parse");
    failures += check(huge_headers.headers_too_large() && error == "headers too large", "header overflow reported");

    Http1RequestParser garbage;
    failures += check(!garbage.feed("NOT HTTP\r\n\r\n"), "garbage request rejected");

    // Response parsing
    Http1ResponseParser response_parser;
    std::string         chunked = "HTTP/1.1 201 Created\r\n"
                                  "Transfer-Encoding: chunked\r\n"
                                  "Set-Cookie: _puid=one; path=/\r\n"
                                  "Set-Cookie: other=two\r\n"
                                  "\r\n"
                                  "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n";
    failures += check(response_parser.feed(chunked), "chunked response accepted");
    failures += check(response_parser.is_message_complete(), "chunked response complete");
    auto upstream = response_parser.take_response();
    failures += check(upstream.status_code == 201 && upstream.reason == "Created", "status line");
    failures += check(upstream.body == "hello world", "chunked body decoded");
    failures += check(upstream.header_values("set-cookie").size() == 2, "both Set-Cookie headers kept");

    Http1ResponseParser until_close;
    failures += check(until_close.feed("HTTP/1.1 200 OK\r\n\r\nstream"), "close-delimited response accepted");
    failures += check(until_close.finish() && until_close.is_message_complete(), "EOF completes the response");
    failures += check(until_close.response().body == "stream", "close-delimited body");

    // Response serialization
    HttpResponse out;
    out.set_status(404);
    out.set_header("Transfer-Encoding", "chunked");
    out.set_header("Content-Type", "application/json");
    out.set_body("{}");
    auto wire = build_http1_response(out, true);
    failures += check(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0, "status line uses the default reason");
    failures += check(wire.find("Transfer-Encoding") == std::string::npos, "upstream framing is dropped");
    failures += check(wire.find("Content-Length: 2\r\n") != std::string::npos, "length recomputed");
    failures += check(wire.find("Connection: close\r\n") != std::string::npos, "connection closed after reply");

    if (failures == 0)
        std::fprintf(stdout, "http_headers_test: all checks passed\n");
    return failures == 0 ? 0 : 1;
}
