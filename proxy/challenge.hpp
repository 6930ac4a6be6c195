#pragma once

#include "gpt_model.hpp"
#include "status.hpp"

#include "../net/http/http_transport.hpp"

#include <optional>
#include <string>

namespace convgate::proxy {

enum class ChallengeType {
    Gpt3,
    Gpt4,
    Auth,
    Platform,
    SignUp,
};

const char*   to_string(ChallengeType type);
const char*   public_key(ChallengeType type);
ChallengeType challenge_type_for(const ChatModel& model);

/**
 * @brief One challenge-token acquisition. Built per call and consumed once.
 */
struct ChallengeRequest {
    net::http::HttpTransport*  client { nullptr };
    ChallengeType              type { ChallengeType::Gpt4 };
    std::optional<std::string> identifier;
};

/**
 * @brief Source of challenge (arkose) tokens. Retries, if any, happen behind this interface.
 */
class ChallengeBroker {
public:
    virtual ~ChallengeBroker() = default;

    // On success @p token holds a non-empty value.
    virtual StatusTask acquire(const ChallengeRequest& request, std::string& token) = 0;
};

/**
 * @brief Broker backed by an HTTP solver service.
 *
 * Sends `POST <endpoint>` with `{"type", "pk", "identifier"}` and expects `{"token": "..."}`.
 */
class RemoteChallengeBroker : public ChallengeBroker {
public:
    explicit RemoteChallengeBroker(std::string endpoint) : endpoint_(std::move(endpoint)) { }

    StatusTask acquire(const ChallengeRequest& request, std::string& token) override;

    const std::string& endpoint() const noexcept { return endpoint_; }

private:
    std::string endpoint_;
};

} // namespace convgate::proxy
