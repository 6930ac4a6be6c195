#include "inbound_request.hpp"

#include "../net/http/header_utils.hpp"

namespace convgate::proxy {

std::optional<std::string> InboundRequest::bearer_auth() const
{
    auto value = net::http::find_header(headers, "authorization");
    if (!value)
        return std::nullopt;
    std::string trimmed = net::http::trim(*value);
    if (!net::http::istarts_with(trimmed, "bearer "))
        return std::nullopt;
    std::string token = net::http::trim(std::string_view(trimmed).substr(7));
    if (token.empty())
        return std::nullopt;
    return token;
}

std::string InboundRequest::path_and_query() const
{
    if (query.empty())
        return path;
    return path + "?" + query;
}

InboundRequest InboundRequest::from_http(net::http::HttpRequest&& request)
{
    InboundRequest out;
    out.method = std::move(request.method);
    net::http::to_upper_inplace(out.method);
    net::http::split_target(request.target, out.path, out.query);
    out.headers = std::move(request.headers);
    if (!request.body.empty())
        out.body = std::move(request.body);
    auto jar = std::make_shared<CookieJar>();
    for (const auto& value : net::http::header_values(out.headers, "cookie")) {
        auto parsed = CookieJar::from_header(value);
        for (auto& cookie : std::move(parsed).cookies())
            jar->add(std::move(cookie));
    }
    out.jar = std::move(jar);
    return out;
}

} // namespace convgate::proxy
