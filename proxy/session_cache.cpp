#include "session_cache.hpp"

#include "constants.hpp"
#include "gpt_model.hpp"

#include "../net/http/http_common.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <array>
#include <cstdio>
#include <vector>

namespace convgate::proxy {

namespace {

    std::optional<std::string> base64url_decode(std::string_view input)
    {
        std::string b64(input);
        for (char& ch : b64) {
            if (ch == '-')
                ch = '+';
            else if (ch == '_')
                ch = '/';
        }
        size_t padding = (4 - b64.size() % 4) % 4;
        if (padding == 3)
            return std::nullopt;
        b64.append(padding, '=');

        std::vector<unsigned char> out(b64.size() / 4 * 3 + 1);
        int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(b64.data()), static_cast<int>(b64.size()));
        if (n < 0)
            return std::nullopt;
        // EVP_DecodeBlock counts the bytes produced by '=' padding
        size_t len = static_cast<size_t>(n) - padding;
        return std::string(reinterpret_cast<const char*>(out.data()), len);
    }

    std::optional<std::string> jwt_profile_email(std::string_view token)
    {
        auto first = token.find('.');
        if (first == std::string_view::npos)
            return std::nullopt;
        auto second = token.find('.', first + 1);
        if (second == std::string_view::npos)
            return std::nullopt;
        auto payload = base64url_decode(token.substr(first + 1, second - first - 1));
        if (!payload)
            return std::nullopt;
        try {
            auto json    = nlohmann::json::parse(*payload);
            auto profile = json.find("https://api.openai.com/profile");
            if (profile == json.end() || !profile->is_object())
                return std::nullopt;
            auto email = profile->find("email");
            if (email == profile->end() || !email->is_string())
                return std::nullopt;
            auto value = email->get<std::string>();
            if (value.empty())
                return std::nullopt;
            return value;
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }

    std::string sha256_hex(std::string_view input)
    {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest {};
        unsigned int                               len = 0;
        if (EVP_Digest(input.data(), input.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1)
            return std::string(input);
        std::string hex;
        hex.reserve(len * 2);
        char buf[3];
        for (unsigned int i = 0; i < len; ++i) {
            std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
            hex.append(buf, 2);
        }
        return hex;
    }

} // namespace

std::string reduce_key(std::string_view credential)
{
    if (credential.rfind("Bearer ", 0) == 0)
        credential.remove_prefix(7);
    if (auto email = jwt_profile_email(credential))
        return *email;
    return sha256_hex(credential);
}

std::optional<std::string> UpstreamPuidFetcher::puid_from_set_cookie(std::string_view set_cookie)
{
    auto end  = set_cookie.find(';');
    auto pair = set_cookie.substr(0, end);
    auto eq   = pair.find('=');
    if (eq == std::string_view::npos)
        return std::nullopt;
    if (net::http::trim(pair.substr(0, eq)) != kSessionCookieName)
        return std::nullopt;
    std::string value = net::http::trim(pair.substr(eq + 1));
    if (value.empty())
        return std::nullopt;
    return value;
}

StatusTask UpstreamPuidFetcher::fetch(std::string credential, std::optional<std::string>& puid)
{
    puid.reset();
    if (credential.rfind("Bearer ", 0) == 0)
        credential.erase(0, 7);

    net::http::OutboundRequest request;
    request.method  = "GET";
    request.url     = api_origin_ + kModelsPath;
    request.headers = { { "authorization", "Bearer " + credential } };

    net::http::HttpResponse response;
    int                     rc = co_await client_.send(request, response);
    if (rc < 0)
        co_return Status::error(ErrorKind::SessionIdFailed, "model listing unreachable (" + std::to_string(rc) + ")");
    if (!response.success())
        co_return Status::error(ErrorKind::SessionIdFailed,
                                "model listing returned " + std::to_string(response.status_code),
                                response.status_code);

    for (const auto& value : response.header_values("set-cookie")) {
        if (auto found = puid_from_set_cookie(value)) {
            puid = std::move(found);
            break;
        }
    }
    if (!puid)
        CONVGATE_LOG_DEBUG("[puid] upstream set no %s cookie", kSessionCookieName);
    co_return Status::ok_status();
}

PuidCache::PuidCache(workqueue<SpinLock>& exec, PuidFetcher& fetcher, std::chrono::seconds ttl)
    : fetcher_(fetcher), ttl_(ttl), flight_(exec)
{
}

std::optional<std::string> PuidCache::lookup(const std::string& cache_key)
{
    std::scoped_lock<SpinLock> lk(lk_);
    auto                       it = entries_.find(cache_key);
    if (it == entries_.end())
        return std::nullopt;
    if (it->second.expires_at <= clock::now()) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void PuidCache::store(const std::string& cache_key, std::string puid)
{
    auto                       now = clock::now();
    std::scoped_lock<SpinLock> lk(lk_);
    purge_expired_unlocked(now);
    entries_[cache_key] = Entry { std::move(puid), now + ttl_ };
}

size_t PuidCache::size() const
{
    std::scoped_lock<SpinLock> lk(lk_);
    return entries_.size();
}

void PuidCache::purge_expired_unlocked(clock::time_point now)
{
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= now)
            it = entries_.erase(it);
        else
            ++it;
    }
}

WorkTask<PuidCache::Acquired> PuidCache::acquire(std::string credential, std::string cache_key)
{
    Acquired result;
    // a flight that finished between the caller's lookup and this one already stored a value
    if ((result.puid = lookup(cache_key)))
        co_return result;
    CONVGATE_LOG_DEBUG("[puid] acquiring for %s", cache_key.c_str());
    result.status = co_await fetcher_.fetch(credential, result.puid);
    if (result.status.ok() && result.puid)
        store(cache_key, *result.puid);
    co_return result;
}

StatusTask PuidCache::get_or_init(std::string                 credential,
                                  std::string                 model,
                                  std::string                 cache_key,
                                  std::optional<std::string>& session_id)
{
    session_id = lookup(cache_key);
    if (session_id)
        co_return Status::ok_status();

    auto parsed = ChatModel::parse(model);
    if (!parsed || !parsed->is_gpt4())
        co_return Status::ok_status();

    auto factory = [this, credential, cache_key]() { return acquire(credential, cache_key); };
    Acquired acquired = co_await flight_.run(cache_key, factory);
    if (!acquired.status.ok()) {
        CONVGATE_LOG_WARN("[puid] acquisition failed: %s", acquired.status.describe().c_str());
        co_return acquired.status;
    }
    session_id = std::move(acquired.puid);
    co_return Status::ok_status();
}

} // namespace convgate::proxy
