#pragma once

#include "context.hpp"
#include "inbound_request.hpp"
#include "status.hpp"

#include "../net/http/http_common.hpp"

namespace convgate::proxy {

/**
 * @brief Session cookie check: the Cookie header already names the session-id cookie.
 * @return InvalidHeaderValue when the Cookie header is not transmittable text.
 */
Status has_session_cookie(const net::http::Headers& headers, bool& present);

/**
 * @brief Credential injection for `POST /backend-api/conversation`.
 *
 * In order: validate body, model and bearer; attach the session cookie; attach the sentinel
 * token; then, for challenge-gated models, mirror an existing arkose_token or acquire one and
 * write it to both the body and the header.
 */
class ConversationRewriter {
public:
    explicit ConversationRewriter(const ProxyContext& ctx) : ctx_(ctx) { }

    static bool matches(const InboundRequest& request);

    // No-op success for requests that do not match.
    StatusTask rewrite(InboundRequest& request);

private:
    const ProxyContext& ctx_;
};

} // namespace convgate::proxy
