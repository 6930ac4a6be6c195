#include "sentinel.hpp"

#include "constants.hpp"

#include <nlohmann/json.hpp>

namespace convgate::proxy {

StatusTask SentinelTokenFetcher::fetch(std::string credential, std::optional<std::string>& token)
{
    token.reset();
    if (credential.rfind("Bearer ", 0) == 0)
        credential.erase(0, 7);

    net::http::OutboundRequest request;
    request.method  = "POST";
    request.url     = api_origin_ + kSentinelPath;
    request.headers = { { "authorization", "Bearer " + credential } };

    net::http::HttpResponse response;
    int                     rc = co_await client_.send(request, response);
    if (rc < 0) {
        CONVGATE_LOG_ERROR("[sentinel] request failed: %d", rc);
        co_return Status::error(ErrorKind::Transport, "sentinel request failed (" + std::to_string(rc) + ")");
    }
    if (!response.success()) {
        CONVGATE_LOG_WARN("[sentinel] upstream answered %d", response.status_code);
        co_return Status::error(ErrorKind::UpstreamRejected,
                                "sentinel endpoint returned " + std::to_string(response.status_code),
                                response.status_code);
    }

    try {
        auto json  = nlohmann::json::parse(response.body);
        auto value = json.find("token");
        if (value != json.end() && value->is_string())
            token = value->get<std::string>();
    } catch (const nlohmann::json::exception& ex) {
        co_return Status::error(ErrorKind::UpstreamUnreadable, std::string("sentinel reply: ") + ex.what());
    }
    co_return Status::ok_status();
}

} // namespace convgate::proxy
