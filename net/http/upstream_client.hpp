#pragma once

#include "http_common.hpp"
#include "http_message.hpp"
#include "http_transport.hpp"

#include "../epoll_reactor.hpp"
#include "../tls.hpp"

#include <string>

namespace convgate::net::http {

struct UpstreamClientOptions {
    bool        verify_peer { true };
    std::string user_agent { "convgate/1.0" };
    size_t      max_response_bytes { 64 * 1024 * 1024 };
};

struct BuiltRequest {
    Headers     headers;
    std::string payload;
};

/**
 * @brief Serialize @p request for HTTP/1.1, adding Host, User-Agent, Accept, Connection and
 * Content-Length when the caller did not set them.
 */
BuiltRequest build_http_request(const OutboundRequest& request, const UrlParts& url, const std::string& user_agent);

/**
 * @brief HTTP/1.1 client over TCP or TLS. One connection per request, `Connection: close`.
 */
class UpstreamHttpClient : public HttpTransport {
public:
    UpstreamHttpClient(epoll_reactor<SpinLock>& reactor, UpstreamClientOptions options);

    TaskInt send(const OutboundRequest& request, HttpResponse& response) override;

private:
    template <class Stream> TaskInt exchange(Stream& stream, const BuiltRequest& built, bool head, HttpResponse& response);

    epoll_reactor<SpinLock>& reactor_;
    UpstreamClientOptions    options_;
    tls_context              tls_;
};

} // namespace convgate::net::http
