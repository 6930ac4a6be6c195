#pragma once

#include "context.hpp"
#include "conversation_rewriter.hpp"
#include "dashboard_rewriter.hpp"
#include "inbound_request.hpp"
#include "status.hpp"

#include "../net/http/http_message.hpp"

#include <string>

namespace convgate::proxy {

/**
 * @brief Upstream reply, or a locally produced one, as handed back to the server layer.
 */
struct ProxyResponse {
    net::http::HttpResponse inner;
    bool                    synthesized { false }; // produced by the local API handler
    std::string             origin;                // upstream the request was sent to
    std::string             url;
};

/**
 * @brief Entry point of the rewriting stage.
 *
 * Either the local handler answers, or the request is rewritten (conversation, then dashboard),
 * its headers converted, and the complete result forwarded once. Any error aborts before
 * anything is sent upstream.
 */
class RequestDispatcher {
public:
    explicit RequestDispatcher(const ProxyContext& ctx) : ctx_(ctx), conversation_(ctx), dashboard_(ctx) { }

    StatusTask dispatch(std::string origin, InboundRequest request, ProxyResponse& response);

private:
    const ProxyContext&  ctx_;
    ConversationRewriter conversation_;
    DashboardRewriter    dashboard_;
};

} // namespace convgate::proxy
