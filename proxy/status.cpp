#include "status.hpp"

#include <nlohmann/json.hpp>

namespace convgate::proxy {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::BodyRequired:
        return "BodyRequired";
    case ErrorKind::BodyMustBeJsonObject:
        return "BodyMustBeJsonObject";
    case ErrorKind::InvalidJson:
        return "InvalidJson";
    case ErrorKind::ModelRequired:
        return "ModelRequired";
    case ErrorKind::InvalidModel:
        return "InvalidModel";
    case ErrorKind::AccessTokenRequired:
        return "AccessTokenRequired";
    case ErrorKind::InvalidHeaderValue:
        return "InvalidHeaderValue";
    case ErrorKind::UpstreamRejected:
        return "UpstreamRejected";
    case ErrorKind::UpstreamUnreadable:
        return "UpstreamUnreadable";
    case ErrorKind::Transport:
        return "Transport";
    case ErrorKind::ChallengeFailed:
        return "ChallengeFailed";
    case ErrorKind::SessionIdFailed:
        return "SessionIdFailed";
    case ErrorKind::Internal:
        return "Internal";
    }
    return "Unknown";
}

const char* to_string(StatusClass cls)
{
    switch (cls) {
    case StatusClass::Ok:
        return "ok";
    case StatusClass::BadRequest:
        return "bad_request";
    case StatusClass::Unauthorized:
        return "unauthorized";
    case StatusClass::Internal:
        return "internal";
    }
    return "internal";
}

StatusClass classify(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return StatusClass::Ok;
    case ErrorKind::BodyRequired:
    case ErrorKind::BodyMustBeJsonObject:
    case ErrorKind::InvalidJson:
    case ErrorKind::ModelRequired:
    case ErrorKind::InvalidModel:
    case ErrorKind::InvalidHeaderValue:
    case ErrorKind::UpstreamRejected:
    case ErrorKind::UpstreamUnreadable:
        return StatusClass::BadRequest;
    case ErrorKind::AccessTokenRequired:
        return StatusClass::Unauthorized;
    case ErrorKind::Transport:
    case ErrorKind::ChallengeFailed:
    case ErrorKind::SessionIdFailed:
    case ErrorKind::Internal:
        return StatusClass::Internal;
    }
    return StatusClass::Internal;
}

int Status::http_status() const
{
    switch (status_class()) {
    case StatusClass::Ok:
        return 200;
    case StatusClass::BadRequest:
        return 400;
    case StatusClass::Unauthorized:
        return 401;
    case StatusClass::Internal:
        return 500;
    }
    return 500;
}

std::string Status::describe() const
{
    std::string out = to_string(kind);
    if (!message.empty()) {
        out.append(": ");
        out.append(message);
    }
    if (upstream_status) {
        out.append(" (upstream ");
        out.append(std::to_string(*upstream_status));
        out.push_back(')');
    }
    return out;
}

net::http::HttpResponse status_to_response(const Status& status)
{
    nlohmann::json body = {
        { "code", status.http_status() },
        { "kind", to_string(status.kind) },
        { "msg", status.message },
    };
    net::http::HttpResponse response;
    response.set_status(status.http_status());
    response.set_header("content-type", "application/json");
    // replace: credentials or user text may carry invalid UTF-8
    response.set_body(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    return response;
}

} // namespace convgate::proxy
