#pragma once

#include "cookie_jar.hpp"
#include "status.hpp"

#include "../net/http/http_common.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace convgate::proxy {

/**
 * @brief Turns inbound client headers into the header set sent upstream.
 */
class HeaderConverter {
public:
    explicit HeaderConverter(std::string default_user_agent = "Mozilla/5.0 (X11; Linux x86_64) convgate/1.0")
        : default_user_agent_(std::move(default_user_agent))
    {
    }
    virtual ~HeaderConverter() = default;

    // Hop-by-hop and proxy-local headers that never cross the proxy.
    static bool is_dropped(std::string_view lower_name);

    /**
     * @brief Build the outbound headers for a request to @p origin + @p path.
     * @param origin scheme://host[:port] of the upstream.
     * @return InvalidHeaderValue when a header name or value cannot be forwarded.
     */
    virtual Status convert(const net::http::Headers& in,
                           const CookieJar&          jar,
                           std::string_view          origin,
                           std::string_view          path,
                           net::http::Headers&       out) const;

private:
    std::string default_user_agent_;
};

} // namespace convgate::proxy
