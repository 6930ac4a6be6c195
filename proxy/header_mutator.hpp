#pragma once

#include "status.hpp"

#include "../net/http/http_common.hpp"

#include <string_view>

namespace convgate::proxy {

/**
 * @brief Overwrites single-valued headers on a request, rejecting values that cannot be sent
 * on the wire.
 */
class HeaderMutator {
public:
    explicit HeaderMutator(net::http::Headers& headers) : headers_(headers) { }

    // Visible ASCII, obs-text and horizontal tab only.
    static bool valid_value(std::string_view value);
    static bool valid_name(std::string_view name);

    /**
     * @brief Replace every @p name header with one entry holding @p value.
     * @return InvalidHeaderValue and no change when the value is not transmittable.
     */
    Status insert(std::string_view name, std::string_view value);

private:
    net::http::Headers& headers_;
};

} // namespace convgate::proxy
