#include "dashboard_rewriter.hpp"

#include "body_codec.hpp"
#include "constants.hpp"

namespace convgate::proxy {

bool DashboardRewriter::matches(const InboundRequest& request)
{
    return request.method == "POST" && request.path == kDashboardApiKeysPath;
}

StatusTask DashboardRewriter::rewrite(InboundRequest& request)
{
    if (!matches(request))
        co_return Status::ok_status();

    if (!request.body)
        co_return Status::error(ErrorKind::BodyRequired, "body required");

    JsonBody body;
    Status   st = JsonBody::parse(*request.body, body);
    if (!st.ok())
        co_return st;

    if (body.contains(kArkoseField))
        co_return Status::ok_status();

    ChallengeRequest challenge;
    challenge.client = ctx_.arkose_client;
    challenge.type   = ChallengeType::Platform;

    std::string arkose;
    st = co_await ctx_.broker->acquire(challenge, arkose);
    if (!st.ok()) {
        CONVGATE_LOG_WARN("[dashboard] platform token acquisition failed: %s", st.describe().c_str());
        co_return st;
    }

    body.set_string(kArkoseField, std::move(arkose));
    co_return body.commit(request.body);
}

} // namespace convgate::proxy
