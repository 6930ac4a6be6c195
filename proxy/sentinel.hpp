#pragma once

#include "status.hpp"

#include "../net/http/http_transport.hpp"

#include <optional>
#include <string>

namespace convgate::proxy {

/**
 * @brief Fetches the per-request chat-requirements (sentinel) token.
 */
class SentinelTokenFetcher {
public:
    SentinelTokenFetcher(net::http::HttpTransport& client, std::string api_origin)
        : client_(client), api_origin_(std::move(api_origin))
    {
    }

    /**
     * @brief POST the sentinel endpoint with @p credential as bearer.
     *
     * A missing or non-string `token` field is success with @p token left empty. Transport
     * failure is Transport; a non-2xx reply is UpstreamRejected; an unparsable body is
     * UpstreamUnreadable.
     */
    StatusTask fetch(std::string credential, std::optional<std::string>& token);

    const std::string& api_origin() const noexcept { return api_origin_; }

private:
    net::http::HttpTransport& client_;
    std::string               api_origin_;
};

} // namespace convgate::proxy
