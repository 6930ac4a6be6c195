#pragma once

#include "cookie_jar.hpp"

#include "../net/http/http_common.hpp"
#include "../net/http/http_message.hpp"

#include <memory>
#include <optional>
#include <string>

namespace convgate::proxy {

/**
 * @brief Request as received from a client, owned by the dispatcher while it is rewritten.
 *
 * The body is only ever replaced wholesale; the jar is shared with the caller and read-only.
 */
struct InboundRequest {
    std::string                      method;
    std::string                      path { "/" };
    std::string                      query;
    net::http::Headers               headers;
    std::optional<std::string>       body;
    std::shared_ptr<const CookieJar> jar;

    // Credential from `Authorization: Bearer <token>`, without the scheme.
    std::optional<std::string> bearer_auth() const;
    std::string                path_and_query() const;

    static InboundRequest from_http(net::http::HttpRequest&& request);
};

} // namespace convgate::proxy
