#pragma once

#include "context.hpp"
#include "inbound_request.hpp"
#include "status.hpp"

namespace convgate::proxy {

/**
 * @brief Adds a platform challenge token to `POST /dashboard/user/api_keys` bodies that carry
 * no arkose_token field. Any present value, even empty, is left alone.
 */
class DashboardRewriter {
public:
    explicit DashboardRewriter(const ProxyContext& ctx) : ctx_(ctx) { }

    static bool matches(const InboundRequest& request);

    StatusTask rewrite(InboundRequest& request);

private:
    const ProxyContext& ctx_;
};

} // namespace convgate::proxy
