#include "proxy_server.hpp"

#include "../net/http/http1_request_parser.hpp"
#include "../net/tcp_stream.hpp"
#include "../proxy/inbound_request.hpp"
#include "../proxy/status.hpp"

#include <nlohmann/json.hpp>

#include <array>

namespace convgate::app {

namespace {

    net::http::HttpResponse plain_error(int code, const char* kind, const std::string& msg)
    {
        net::http::HttpResponse response;
        response.set_status(code);
        response.set_header("content-type", "application/json");
        response.set_body(nlohmann::json { { "code", code }, { "kind", kind }, { "msg", msg } }.dump());
        return response;
    }

} // namespace

ProxyServer::ProxyServer(workqueue<SpinLock>&          exec,
                         net::epoll_reactor<SpinLock>& reactor,
                         proxy::RequestDispatcher&     dispatcher,
                         std::string                   origin,
                         size_t                        max_body_bytes)
    : exec_(exec)
    , reactor_(reactor)
    , dispatcher_(dispatcher)
    , origin_(std::move(origin))
    , max_body_bytes_(max_body_bytes)
    , listener_(reactor)
{
}

void ProxyServer::bind(const std::string& host, uint16_t port)
{
    listener_.bind_listen(host, port);
    CONVGATE_LOG_INFO("[server] listening on %s:%u, forwarding to %s", host.c_str(), static_cast<unsigned>(port),
                      origin_.c_str());
}

void ProxyServer::stop()
{
    listener_.close();
}

WorkTask<void> ProxyServer::serve()
{
    for (;;) {
        int fd = co_await listener_.accept();
        if (fd < 0)
            break;
        auto conn = handle_connection(fd, next_id_.fetch_add(1, std::memory_order_relaxed));
        post_to(conn, exec_);
    }
    CONVGATE_LOG_INFO("[server] accept loop finished, %d connection(s) active", active_connections());
}

WorkTask<void> ProxyServer::handle_connection(int fd, uint64_t id)
{
    active_.fetch_add(1, std::memory_order_acq_rel);
    net::tcp_stream<SpinLock>     client(fd, reactor_);
    net::http::Http1RequestParser parser;
    parser.set_max_body_bytes(max_body_bytes_);

    std::array<char, 8192> buffer {};
    std::string            error;
    bool                   parse_ok = true;
    while (!parser.is_message_complete()) {
        ssize_t n = co_await client.recv(buffer.data(), buffer.size());
        if (n < 0) {
            CONVGATE_LOG_DEBUG("[server] #%llu recv failed: %zd", static_cast<unsigned long long>(id), n);
            client.close();
            active_.fetch_sub(1, std::memory_order_acq_rel);
            co_return;
        }
        if (n == 0) {
            parse_ok = parser.finish(&error);
            break;
        }
        if (!parser.feed(std::string_view(buffer.data(), static_cast<size_t>(n)), &error)) {
            parse_ok = false;
            break;
        }
    }

    net::http::HttpResponse reply;
    if (!parse_ok || !parser.is_message_complete()) {
        if (parser.body_too_large()) {
            CONVGATE_LOG_WARN("[server] #%llu request body over %zu bytes", static_cast<unsigned long long>(id),
                              max_body_bytes_);
            reply = plain_error(413, "PayloadTooLarge", "request body too large");
        } else if (parser.headers_too_large()) {
            reply = plain_error(431, "HeadersTooLarge", "request headers too large");
        } else if (!parser.is_headers_complete() && error.empty()) {
            // peer closed before sending a request
            client.close();
            active_.fetch_sub(1, std::memory_order_acq_rel);
            co_return;
        } else {
            CONVGATE_LOG_INFO("[server] #%llu parse error: %s", static_cast<unsigned long long>(id), error.c_str());
            reply = plain_error(400, "BadRequest", error.empty() ? "incomplete request" : error);
        }
    } else {
        auto request = proxy::InboundRequest::from_http(parser.take_request());
        CONVGATE_LOG_INFO("[server] #%llu %s %s", static_cast<unsigned long long>(id), request.method.c_str(),
                          request.path.c_str());
        proxy::ProxyResponse result;
        proxy::Status        st = co_await dispatcher_.dispatch(origin_, std::move(request), result);
        if (st.ok()) {
            reply = std::move(result.inner);
        } else {
            reply = proxy::status_to_response(st);
        }
        CONVGATE_LOG_INFO("[server] #%llu -> %d%s", static_cast<unsigned long long>(id), reply.status_code,
                          st.ok() ? "" : (" " + st.describe()).c_str());
    }

    std::string wire = net::http::build_http1_response(reply, true);
    ssize_t     sent = co_await client.send_all(wire.data(), wire.size());
    if (sent < 0)
        CONVGATE_LOG_DEBUG("[server] #%llu send failed: %zd", static_cast<unsigned long long>(id), sent);
    client.shutdown_tx();
    client.close();
    active_.fetch_sub(1, std::memory_order_acq_rel);
}

} // namespace convgate::app
