#include "upstream_client.hpp"

#include "header_utils.hpp"
#include "http1_response_parser.hpp"

#include "../tcp_stream.hpp"

#include <array>
#include <cerrno>
#include <exception>
#include <memory>

namespace convgate::net::http {

BuiltRequest build_http_request(const OutboundRequest& request, const UrlParts& url, const std::string& user_agent)
{
    BuiltRequest result;
    result.headers = request.headers;

    const bool send_body = request.body.has_value();

    if (!header_exists(result.headers, "Host"))
        result.headers.insert(result.headers.begin(), { "Host", url.authority() });

    if (!header_exists(result.headers, "User-Agent"))
        result.headers.push_back({ "User-Agent", user_agent });

    if (!header_exists(result.headers, "Accept"))
        result.headers.push_back({ "Accept", "*/*" });

    set_header(result.headers, "Connection", "close");

    remove_header(result.headers, "Transfer-Encoding");
    remove_header(result.headers, "Content-Length");
    if (send_body || request.method == "POST" || request.method == "PUT" || request.method == "PATCH")
        result.headers.push_back({ "Content-Length", std::to_string(send_body ? request.body->size() : 0) });

    std::string_view path = url.path.empty() ? std::string_view { "/" } : std::string_view { url.path };
    result.payload.reserve(request.method.size() + path.size() + 32 + (send_body ? request.body->size() : 0));
    result.payload.append(request.method);
    result.payload.push_back(' ');
    result.payload.append(path.data(), path.size());
    result.payload.append(" HTTP/1.1\r\n");
    for (const auto& header : result.headers) {
        result.payload.append(header.name);
        result.payload.append(": ");
        result.payload.append(header.value);
        result.payload.append("\r\n");
    }
    result.payload.append("\r\n");
    if (send_body)
        result.payload.append(*request.body);
    return result;
}

UpstreamHttpClient::UpstreamHttpClient(epoll_reactor<SpinLock>& reactor, UpstreamClientOptions options)
    : reactor_(reactor), options_(std::move(options)), tls_(tls_context::make_client(options_.verify_peer))
{
}

template <class Stream>
UpstreamHttpClient::TaskInt
UpstreamHttpClient::exchange(Stream& stream, const BuiltRequest& built, bool head, HttpResponse& response)
{
    Http1ResponseParser parser;
    parser.set_skip_body(head);

    ssize_t sent = co_await stream.send_all(built.payload.data(), built.payload.size());
    if (sent < 0)
        co_return static_cast<int>(sent);

    std::array<char, 16384> buffer {};
    size_t                  received = 0;
    while (!parser.is_message_complete()) {
        ssize_t n = co_await stream.recv(buffer.data(), buffer.size());
        if (n < 0)
            co_return static_cast<int>(n);
        if (n == 0)
            break;
        received += static_cast<size_t>(n);
        if (received > options_.max_response_bytes) {
            CONVGATE_LOG_WARN("[upstream] response exceeds %zu bytes", options_.max_response_bytes);
            co_return -EMSGSIZE;
        }
        std::string parse_error;
        if (!parser.feed(std::string_view(buffer.data(), static_cast<size_t>(n)), &parse_error)) {
            CONVGATE_LOG_WARN("[upstream] malformed response: %s", parse_error.c_str());
            co_return -EPROTO;
        }
    }

    if (!parser.is_message_complete()) {
        std::string parse_error;
        if (!parser.finish(&parse_error) || !parser.is_headers_complete()) {
            CONVGATE_LOG_WARN("[upstream] truncated response: %s", parse_error.c_str());
            co_return -EPROTO;
        }
    }

    response = parser.take_response();
    co_return 0;
}

UpstreamHttpClient::TaskInt UpstreamHttpClient::send(const OutboundRequest& request, HttpResponse& response)
{
    response.reset();

    auto url = parse_url(request.url);
    if (!url) {
        CONVGATE_LOG_ERROR("[upstream] invalid url %s", request.url.c_str());
        co_return -EINVAL;
    }

    BuiltRequest built = build_http_request(request, *url, options_.user_agent);
    const bool   head  = request.method == "HEAD";
    CONVGATE_LOG_DEBUG("[upstream] %s %s://%s%s", request.method.c_str(), url->scheme.c_str(), url->host.c_str(),
                       url->path.c_str());

    tcp_stream<SpinLock> tcp(reactor_);
    int                  rc = co_await tcp.connect(url->host, url->port);
    if (rc < 0) {
        CONVGATE_LOG_WARN("[upstream] connect %s:%u failed: %d", url->host.c_str(), static_cast<unsigned>(url->port), rc);
        co_return rc;
    }

    if (!url->is_https()) {
        rc = co_await exchange(tcp, built, head, response);
        co_return rc;
    }

    std::unique_ptr<tls_stream<SpinLock>> tls;
    try {
        tls = std::make_unique<tls_stream<SpinLock>>(std::move(tcp), tls_, url->host);
    } catch (const std::exception& ex) {
        CONVGATE_LOG_ERROR("[upstream] tls setup failed: %s", ex.what());
        co_return -EPROTO;
    }
    rc = co_await tls->handshake();
    if (rc < 0)
        co_return rc;
    rc = co_await exchange(*tls, built, head, response);
    co_return rc;
}

} // namespace convgate::net::http
