#pragma once

#include "http_common.hpp"
#include "http_message.hpp"

#include "../../task/worker.hpp"

#include <optional>
#include <string>

namespace convgate::net::http {

struct OutboundRequest {
    std::string                method { "GET" };
    std::string                url;
    Headers                    headers;
    std::optional<std::string> body;
};

/**
 * @brief Outbound HTTP client seam. Implementations must be safe to share between concurrent
 * requests.
 */
class HttpTransport {
public:
    using TaskInt = WorkTask<int>;

    virtual ~HttpTransport() = default;

    /**
     * @brief Send @p request and buffer the full reply into @p response.
     * @return 0 on success (any HTTP status), negative errno on transport failure.
     */
    virtual TaskInt send(const OutboundRequest& request, HttpResponse& response) = 0;
};

} // namespace convgate::net::http
