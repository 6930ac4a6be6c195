#include "conversation_rewriter.hpp"

#include "body_codec.hpp"
#include "constants.hpp"
#include "gpt_model.hpp"
#include "header_mutator.hpp"

#include "../net/http/header_utils.hpp"

namespace convgate::proxy {

Status has_session_cookie(const net::http::Headers& headers, bool& present)
{
    present = false;
    for (const auto& value : net::http::header_values(headers, "cookie")) {
        if (!HeaderMutator::valid_value(value))
            return Status::error(ErrorKind::InvalidHeaderValue, "cookie header is not visible text");
        if (value.find(kSessionCookieName) != std::string::npos)
            present = true;
    }
    return Status::ok_status();
}

bool ConversationRewriter::matches(const InboundRequest& request)
{
    return request.method == "POST" && request.path == kConversationPath;
}

StatusTask ConversationRewriter::rewrite(InboundRequest& request)
{
    if (!matches(request))
        co_return Status::ok_status();

    if (!request.body)
        co_return Status::error(ErrorKind::BodyRequired, "body required");

    JsonBody body;
    Status   st = JsonBody::parse(*request.body, body);
    if (!st.ok())
        co_return st;

    auto model_name = body.string_field(kModelField);
    if (!model_name)
        co_return Status::error(ErrorKind::ModelRequired, "model required");

    auto token = request.bearer_auth();
    if (!token)
        co_return Status::error(ErrorKind::AccessTokenRequired, "access token required");

    HeaderMutator headers(request.headers);

    bool has_cookie = false;
    st              = has_session_cookie(request.headers, has_cookie);
    if (!st.ok())
        co_return st;
    if (!has_cookie) {
        std::optional<std::string> session_id;
        std::string                cache_key = reduce_key(*token);
        st = co_await ctx_.session_cache->get_or_init(*token, *model_name, cache_key, session_id);
        if (!st.ok())
            co_return st;
        if (session_id) {
            st = headers.insert("cookie", std::string(kSessionCookieName) + "=" + *session_id + ";");
            if (!st.ok())
                co_return st;
        }
    }

    std::optional<std::string> sentinel;
    st = co_await ctx_.sentinel->fetch(*token, sentinel);
    if (!st.ok())
        co_return st;
    if (sentinel) {
        st = headers.insert(kSentinelHeader, *sentinel);
        if (!st.ok())
            co_return st;
        CONVGATE_LOG_DEBUG("[conv] chat requirements token: %s", sentinel->c_str());
    } else {
        CONVGATE_LOG_WARN("[conv] chat requirements token not found");
    }

    auto model = ChatModel::parse(*model_name);
    if (!model)
        co_return Status::error(ErrorKind::InvalidModel, "invalid model: " + *model_name);

    if (!((ctx_.arkose_gpt3_experiment && model->is_gpt3()) || model->is_gpt4()))
        co_return Status::ok_status();

    bool need_token = true;
    if (body.contains(kArkoseField)) {
        std::string existing = body.string_field(kArkoseField).value_or("");
        if (!existing.empty() && existing != kNullLiteral) {
            st = headers.insert(kArkoseHeader, existing);
            if (!st.ok())
                co_return st;
            need_token = false;
            CONVGATE_LOG_DEBUG("[conv] client supplied arkose token");
        }
    }
    if (!need_token)
        co_return Status::ok_status();

    ChallengeRequest challenge;
    challenge.client     = ctx_.arkose_client;
    challenge.type       = challenge_type_for(*model);
    challenge.identifier = *token;

    std::string arkose;
    st = co_await ctx_.broker->acquire(challenge, arkose);
    if (!st.ok()) {
        CONVGATE_LOG_WARN("[conv] challenge token acquisition failed: %s", st.describe().c_str());
        co_return st;
    }

    // Header first so an invalid token leaves the body untouched.
    st = headers.insert(kArkoseHeader, arkose);
    if (!st.ok())
        co_return st;
    body.set_string(kArkoseField, arkose);
    st = body.commit(request.body);
    if (!st.ok())
        co_return st;
    CONVGATE_LOG_DEBUG("[conv] arkose token attached for %s", model->name().c_str());
    co_return Status::ok_status();
}

} // namespace convgate::proxy
