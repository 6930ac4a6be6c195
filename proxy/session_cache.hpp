#pragma once

#include "status.hpp"

#include "../net/http/http_transport.hpp"
#include "../sync/single_flight.hpp"
#include "../task/workqueue.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace convgate::proxy {

/**
 * @brief Cache key for a bearer credential: the profile email of a JWT access token, or the hex
 * SHA-256 of the credential when it carries none.
 */
std::string reduce_key(std::string_view credential);

/**
 * @brief Per-client session id (PUID) store.
 */
class SessionIdCache {
public:
    virtual ~SessionIdCache() = default;

    /**
     * @brief Return the cached session id for @p cache_key, acquiring it once if absent.
     *
     * At most one acquisition runs per key; concurrent callers observe its result. An empty
     * @p session_id with an ok status means the upstream issues none for this client or model.
     */
    virtual StatusTask get_or_init(std::string                 credential,
                                   std::string                 model,
                                   std::string                 cache_key,
                                   std::optional<std::string>& session_id)
        = 0;
};

class PuidFetcher {
public:
    virtual ~PuidFetcher() = default;

    virtual StatusTask fetch(std::string credential, std::optional<std::string>& puid) = 0;
};

/**
 * @brief Reads `_puid` from the Set-Cookie headers of the upstream model listing.
 */
class UpstreamPuidFetcher : public PuidFetcher {
public:
    UpstreamPuidFetcher(net::http::HttpTransport& client, std::string api_origin)
        : client_(client), api_origin_(std::move(api_origin))
    {
    }

    StatusTask fetch(std::string credential, std::optional<std::string>& puid) override;

    // Value of the `_puid` cookie in a Set-Cookie header value, if that is the cookie it sets.
    static std::optional<std::string> puid_from_set_cookie(std::string_view set_cookie);

private:
    net::http::HttpTransport& client_;
    std::string               api_origin_;
};

/**
 * @brief TTL store in front of a PuidFetcher with single-flight acquisition per key. Only GPT-4
 * class models acquire a session id.
 */
class PuidCache : public SessionIdCache {
public:
    struct Acquired {
        Status                     status;
        std::optional<std::string> puid;
    };

    PuidCache(workqueue<SpinLock>& exec, PuidFetcher& fetcher, std::chrono::seconds ttl);

    StatusTask get_or_init(std::string                 credential,
                           std::string                 model,
                           std::string                 cache_key,
                           std::optional<std::string>& session_id) override;

    std::optional<std::string> lookup(const std::string& cache_key);
    void                       store(const std::string& cache_key, std::string puid);
    size_t                     size() const;

private:
    using clock = std::chrono::steady_clock;

    struct Entry {
        std::string       value;
        clock::time_point expires_at;
    };

    WorkTask<Acquired> acquire(std::string credential, std::string cache_key);
    void               purge_expired_unlocked(clock::time_point now);

    PuidFetcher&                           fetcher_;
    std::chrono::seconds                   ttl_;
    SingleFlight<Acquired>                 flight_;
    mutable SpinLock                       lk_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace convgate::proxy
