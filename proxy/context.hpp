#pragma once

#include "challenge.hpp"
#include "header_converter.hpp"
#include "local_api.hpp"
#include "sentinel.hpp"
#include "session_cache.hpp"

#include "../net/http/http_transport.hpp"

namespace convgate::proxy {

/**
 * @brief Service handles shared by every request. Built once at startup; the dispatcher and
 * rewriters only borrow them. local_api may be null.
 */
struct ProxyContext {
    net::http::HttpTransport* upstream { nullptr };
    net::http::HttpTransport* arkose_client { nullptr };
    ChallengeBroker*          broker { nullptr };
    SessionIdCache*           session_cache { nullptr };
    SentinelTokenFetcher*     sentinel { nullptr };
    const HeaderConverter*    header_converter { nullptr };
    LocalApiHandler*          local_api { nullptr };
    bool                      arkose_gpt3_experiment { false };
};

} // namespace convgate::proxy
