#pragma once

#include "../net/http/http_transport.hpp"
#include "../proxy/challenge.hpp"
#include "../proxy/session_cache.hpp"
#include "../proxy/status.hpp"
#include "../task/worker.hpp"

#include <coroutine>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace convgate::test {

inline int check(bool condition, const char* message)
{
    if (condition)
        return 0;
    std::fprintf(stderr, "[FAIL] %s\n", message);
    return 1;
}

// Run everything queued on @p wq, including work queued while draining.
inline void drain(workqueue<SpinLock>& wq)
{
    while (wq.work_once()) { }
}

template <class T> WorkTask<void> capture(WorkTask<T> task, std::optional<T>& out)
{
    out.emplace(co_await task);
}

/**
 * @brief Post @p task on @p wq, drain the queue and return its result (empty if it is still
 * suspended on something the queue does not drive).
 */
template <class T> std::optional<T> run_on(workqueue<SpinLock>& wq, WorkTask<T> task)
{
    std::optional<T> out;
    auto             root = capture(std::move(task), out);
    post_to(root, wq);
    drain(wq);
    return out;
}

// Suspends awaiters until release().
struct Gate {
    std::vector<std::coroutine_handle<>> parked;
    bool                                 open { false };

    struct Awaiter {
        Gate& gate;
        bool  await_ready() const noexcept { return gate.open; }
        void  await_suspend(std::coroutine_handle<> h) { gate.parked.push_back(h); }
        void  await_resume() const noexcept { }
    };

    Awaiter wait() { return Awaiter { *this }; }

    void release()
    {
        open            = true;
        auto parked_now = std::move(parked);
        parked.clear();
        for (auto h : parked_now)
            h.resume();
    }
};

/**
 * @brief Transport answering from the route with the longest matching URL prefix and recording
 * every request it was given.
 */
class FakeTransport : public net::http::HttpTransport {
public:
    struct Route {
        std::string        prefix;
        int                rc { 0 };
        int                status { 200 };
        std::string        body;
        net::http::Headers headers;
    };

    void route(std::string prefix, int status, std::string body, net::http::Headers headers = {})
    {
        routes_.push_back(Route { std::move(prefix), 0, status, std::move(body), std::move(headers) });
    }

    void fail(std::string prefix, int rc) { routes_.push_back(Route { std::move(prefix), rc, 0, {}, {} }); }

    void clear_routes() { routes_.clear(); }

    TaskInt send(const net::http::OutboundRequest& request, net::http::HttpResponse& response) override
    {
        sent.push_back(request);
        const Route* best = nullptr;
        for (const auto& r : routes_) {
            if (request.url.rfind(r.prefix, 0) == 0 && (!best || r.prefix.size() > best->prefix.size()))
                best = &r;
        }
        response.reset();
        if (!best) {
            response.set_status(404);
            co_return 0;
        }
        if (best->rc < 0)
            co_return best->rc;
        response.set_status(best->status);
        for (const auto& h : best->headers)
            response.add_header(h.name, h.value);
        response.set_body(best->body);
        co_return 0;
    }

    size_t count(std::string_view prefix) const
    {
        size_t n = 0;
        for (const auto& r : sent) {
            if (r.url.rfind(prefix, 0) == 0)
                ++n;
        }
        return n;
    }

    std::vector<net::http::OutboundRequest> sent;

private:
    std::vector<Route> routes_;
};

class FakeBroker : public proxy::ChallengeBroker {
public:
    explicit FakeBroker(std::string token = "chal789") : token_(std::move(token)) { }

    proxy::StatusTask acquire(const proxy::ChallengeRequest& request, std::string& token) override
    {
        ++calls;
        last_type       = request.type;
        last_identifier = request.identifier;
        if (fail_with)
            co_return proxy::Status::error(*fail_with, "broker failure");
        token = token_;
        co_return proxy::Status::ok_status();
    }

    int                                 calls { 0 };
    std::optional<proxy::ChallengeType> last_type;
    std::optional<std::string>          last_identifier;
    std::optional<proxy::ErrorKind>     fail_with;

private:
    std::string token_;
};

class FakeSessionCache : public proxy::SessionIdCache {
public:
    explicit FakeSessionCache(std::optional<std::string> value) : value_(std::move(value)) { }

    proxy::StatusTask get_or_init(std::string                 credential,
                           std::string                 model,
                           std::string                 cache_key,
                           std::optional<std::string>& session_id) override
    {
        ++calls;
        last_credential = credential;
        last_model      = model;
        last_key        = cache_key;
        session_id      = value_;
        co_return proxy::Status::ok_status();
    }

    int         calls { 0 };
    std::string last_credential;
    std::string last_model;
    std::string last_key;

private:
    std::optional<std::string> value_;
};

/**
 * @brief PUID fetcher that parks every call on a gate before answering.
 */
class GatedPuidFetcher : public proxy::PuidFetcher {
public:
    GatedPuidFetcher(Gate& gate, std::string value) : gate_(gate), value_(std::move(value)) { }

    proxy::StatusTask fetch(std::string credential, std::optional<std::string>& puid) override
    {
        ++calls;
        last_credential = credential;
        co_await gate_.wait();
        puid = value_;
        co_return proxy::Status::ok_status();
    }

    int         calls { 0 };
    std::string last_credential;

private:
    Gate&       gate_;
    std::string value_;
};

} // namespace convgate::test
