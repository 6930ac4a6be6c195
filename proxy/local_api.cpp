#include "local_api.hpp"

#include "constants.hpp"

#include <nlohmann/json.hpp>

namespace convgate::proxy {

bool ApiKeyShortCircuit::supports(const InboundRequest& request) const
{
    if (request.method != "POST" || request.path != kConversationPath)
        return false;
    auto token = request.bearer_auth();
    return token && token->rfind("sk-", 0) == 0;
}

StatusTask ApiKeyShortCircuit::handle(InboundRequest& request, net::http::HttpResponse& response)
{
    CONVGATE_LOG_INFO("[local] %s %s answered locally", request.method.c_str(), request.path.c_str());
    nlohmann::json body = {
        { "code", 501 },
        { "kind", "NotImplemented" },
        { "msg", "platform API keys are not accepted on the conversation endpoint" },
    };
    response.reset();
    response.set_status(501);
    response.set_header("content-type", "application/json");
    response.set_body(body.dump());
    co_return Status::ok_status();
}

} // namespace convgate::proxy
