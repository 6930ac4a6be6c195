#include "dispatcher.hpp"

#include "../net/http/http_transport.hpp"

namespace convgate::proxy {

StatusTask RequestDispatcher::dispatch(std::string origin, InboundRequest request, ProxyResponse& response)
{
    response = ProxyResponse {};

    if (ctx_.local_api && ctx_.local_api->supports(request)) {
        response.synthesized = true;
        co_return co_await ctx_.local_api->handle(request, response.inner);
    }

    while (!origin.empty() && origin.back() == '/')
        origin.pop_back();
    std::string url = origin + request.path_and_query();

    Status st = co_await conversation_.rewrite(request);
    if (!st.ok()) {
        CONVGATE_LOG_INFO("[dispatch] %s %s rejected: %s", request.method.c_str(), request.path.c_str(),
                          st.describe().c_str());
        co_return st;
    }

    st = co_await dashboard_.rewrite(request);
    if (!st.ok()) {
        CONVGATE_LOG_INFO("[dispatch] %s %s rejected: %s", request.method.c_str(), request.path.c_str(),
                          st.describe().c_str());
        co_return st;
    }

    net::http::OutboundRequest outbound;
    outbound.method = request.method;
    outbound.url    = url;
    CookieJar empty_jar;
    st = ctx_.header_converter->convert(request.headers, request.jar ? *request.jar : empty_jar, origin,
                                        request.path, outbound.headers);
    if (!st.ok())
        co_return st;
    if (request.body)
        outbound.body = std::move(request.body);

    int rc = co_await ctx_.upstream->send(outbound, response.inner);
    if (rc < 0) {
        CONVGATE_LOG_ERROR("[dispatch] %s %s failed: %d", outbound.method.c_str(), url.c_str(), rc);
        co_return Status::error(ErrorKind::Transport, "upstream request failed (" + std::to_string(rc) + ")");
    }

    CONVGATE_LOG_DEBUG("[dispatch] %s %s -> %d", outbound.method.c_str(), url.c_str(), response.inner.status_code);
    response.origin = std::move(origin);
    response.url    = std::move(url);
    co_return Status::ok_status();
}

} // namespace convgate::proxy
