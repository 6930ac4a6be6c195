#pragma once

#include "../net/http/http_message.hpp"
#include "../task/worker.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace convgate::proxy {

enum class ErrorKind {
    None,
    BodyRequired,
    BodyMustBeJsonObject,
    InvalidJson,
    ModelRequired,
    InvalidModel,
    AccessTokenRequired,
    InvalidHeaderValue,
    UpstreamRejected,
    UpstreamUnreadable,
    Transport,
    ChallengeFailed,
    SessionIdFailed,
    Internal,
};

enum class StatusClass {
    Ok,
    BadRequest,
    Unauthorized,
    Internal,
};

const char* to_string(ErrorKind kind);
const char* to_string(StatusClass cls);
StatusClass classify(ErrorKind kind);

/**
 * @brief Outcome of a rewrite step. A default constructed Status is success.
 */
struct Status {
    ErrorKind          kind { ErrorKind::None };
    std::string        message;
    std::optional<int> upstream_status; // set when the failure is an upstream HTTP reply

    static Status ok_status() { return {}; }
    static Status error(ErrorKind kind, std::string message, std::optional<int> upstream = std::nullopt)
    {
        return Status { kind, std::move(message), upstream };
    }

    bool        ok() const { return kind == ErrorKind::None; }
    StatusClass status_class() const { return classify(kind); }
    int         http_status() const;
    std::string describe() const;
};

using StatusTask = WorkTask<Status>;

/**
 * @brief Render @p status as a JSON error reply: `{"code": <http>, "kind": "<Kind>", "msg": "..."}`.
 */
net::http::HttpResponse status_to_response(const Status& status);

} // namespace convgate::proxy
