#pragma once

#include "inbound_request.hpp"
#include "status.hpp"

#include "../net/http/http_message.hpp"

namespace convgate::proxy {

/**
 * @brief In-proxy handler that answers some requests instead of forwarding them.
 */
class LocalApiHandler {
public:
    virtual ~LocalApiHandler() = default;

    virtual bool       supports(const InboundRequest& request) const                       = 0;
    virtual StatusTask handle(InboundRequest& request, net::http::HttpResponse& response) = 0;
};

/**
 * @brief Claims conversation requests authenticated with a platform API key (`sk-...`).
 * Converting them to the platform API is not provided here, so the reply is a 501.
 */
class ApiKeyShortCircuit : public LocalApiHandler {
public:
    bool       supports(const InboundRequest& request) const override;
    StatusTask handle(InboundRequest& request, net::http::HttpResponse& response) override;
};

} // namespace convgate::proxy
