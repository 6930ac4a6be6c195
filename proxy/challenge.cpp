#include "challenge.hpp"

#include <nlohmann/json.hpp>

namespace convgate::proxy {

const char* to_string(ChallengeType type)
{
    switch (type) {
    case ChallengeType::Gpt3:
        return "gpt3";
    case ChallengeType::Gpt4:
        return "gpt4";
    case ChallengeType::Auth:
        return "auth";
    case ChallengeType::Platform:
        return "platform";
    case ChallengeType::SignUp:
        return "signup";
    }
    return "gpt4";
}

const char* public_key(ChallengeType type)
{
    switch (type) {
    case ChallengeType::Gpt3:
        return "3D86FBBA-9D22-402A-B512-3420086BA6CC";
    case ChallengeType::Gpt4:
        return "35536E1E-65B4-4D96-9D97-6ADB7EFF8147";
    case ChallengeType::Auth:
    case ChallengeType::SignUp:
        return "0A1D34FC-659D-4E23-B17B-694DCFCF6A6C";
    case ChallengeType::Platform:
        return "23AAD243-4799-4A9E-B01D-1166C5DE02DF";
    }
    return "";
}

ChallengeType challenge_type_for(const ChatModel& model)
{
    return model.is_gpt3() ? ChallengeType::Gpt3 : ChallengeType::Gpt4;
}

StatusTask RemoteChallengeBroker::acquire(const ChallengeRequest& request, std::string& token)
{
    if (!request.client)
        co_return Status::error(ErrorKind::ChallengeFailed, "no http client for challenge broker");
    if (endpoint_.empty())
        co_return Status::error(ErrorKind::ChallengeFailed, "challenge endpoint not configured");

    nlohmann::json payload = {
        { "type", to_string(request.type) },
        { "pk", public_key(request.type) },
    };
    if (request.identifier)
        payload["identifier"] = *request.identifier;
    else
        payload["identifier"] = nullptr;

    net::http::OutboundRequest out;
    out.method  = "POST";
    out.url     = endpoint_;
    out.headers = { { "content-type", "application/json" }, { "accept", "application/json" } };
    try {
        out.body = payload.dump();
    } catch (const nlohmann::json::exception& ex) {
        co_return Status::error(ErrorKind::ChallengeFailed, ex.what());
    }

    net::http::HttpResponse response;
    int                     rc = co_await request.client->send(out, response);
    if (rc < 0) {
        CONVGATE_LOG_WARN("[arkose] solver unreachable: %d", rc);
        co_return Status::error(ErrorKind::ChallengeFailed, "challenge solver unreachable (" + std::to_string(rc) + ")");
    }
    if (!response.success()) {
        CONVGATE_LOG_WARN("[arkose] solver answered %d", response.status_code);
        co_return Status::error(ErrorKind::ChallengeFailed, "challenge solver rejected the request", response.status_code);
    }

    try {
        auto json  = nlohmann::json::parse(response.body);
        auto value = json.find("token");
        if (value == json.end() || !value->is_string() || value->get<std::string>().empty())
            co_return Status::error(ErrorKind::ChallengeFailed, "challenge solver returned no token");
        token = value->get<std::string>();
    } catch (const nlohmann::json::exception& ex) {
        co_return Status::error(ErrorKind::ChallengeFailed, std::string("unreadable solver reply: ") + ex.what());
    }
    CONVGATE_LOG_DEBUG("[arkose] %s token acquired", to_string(request.type));
    co_return Status::ok_status();
}

} // namespace convgate::proxy
