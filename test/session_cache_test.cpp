#include "test_support.hpp"

#include "../net/http/header_utils.hpp"
#include "../proxy/challenge.hpp"
#include "../proxy/constants.hpp"
#include "../proxy/context.hpp"
#include "../proxy/conversation_rewriter.hpp"
#include "../proxy/header_converter.hpp"
#include "../proxy/sentinel.hpp"
#include "../proxy/session_cache.hpp"
#include "../sync/single_flight.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace convgate;
using namespace convgate::proxy;
using convgate::test::check;
using convgate::test::run_on;
using net::http::find_header;

namespace {

constexpr const char* kApiOrigin = "https://chat.openai.com";

// JWT whose payload is {"https://api.openai.com/profile":{"email":"user@example.com"},"sub":"x"}
constexpr const char* kProfileJwt
    = "eyJhbGciOiJSUzI1NiJ9."
      "eyJodHRwczovL2FwaS5vcGVuYWkuY29tL3Byb2ZpbGUiOnsiZW1haWwiOiJ1c2VyQGV4YW1wbGUuY29tIn0sInN1YiI6IngifQ."
      "c2lnbmF0dXJl";

WorkTask<int> gated_value(test::Gate& gate, int value)
{
    co_await gate.wait();
    co_return value;
}

WorkTask<int> ready_value(int value)
{
    co_return value;
}

int test_reduce_key()
{
    int failures = 0;
    failures += check(reduce_key(kProfileJwt) == "user@example.com", "JWT profile email is the key");
    failures += check(reduce_key(std::string("Bearer ") + kProfileJwt) == "user@example.com",
                      "bearer prefix is ignored");
    failures += check(reduce_key("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                      "opaque credential hashes to sha256 hex");
    failures += check(reduce_key("eyJhbGciOiJSUzI1NiJ9.eyJzdWIiOiJ5In0.sig").size() == 64,
                      "JWT without profile email falls back to the digest");
    failures += check(reduce_key("a.b.c") != reduce_key("a.b.d"), "distinct credentials give distinct keys");
    return failures;
}

int test_set_cookie_parsing()
{
    int failures = 0;
    auto v       = UpstreamPuidFetcher::puid_from_set_cookie("_puid=user-abc:1700000000; path=/; secure; HttpOnly");
    failures += check(v == std::string("user-abc:1700000000"), "puid value read from Set-Cookie");
    failures += check(!UpstreamPuidFetcher::puid_from_set_cookie("__cf_bm=zz; path=/"), "other cookies ignored");
    failures += check(!UpstreamPuidFetcher::puid_from_set_cookie("_puid=; path=/"), "empty puid ignored");
    failures += check(!UpstreamPuidFetcher::puid_from_set_cookie("x_puid=1"), "name must match exactly");
    return failures;
}

int test_upstream_fetcher()
{
    int failures = 0;
    {
        workqueue<SpinLock> wq;
        test::FakeTransport transport;
        transport.route(std::string(kApiOrigin) + kModelsPath, 200, R"({"models":[]})",
                        { { "set-cookie", "__cf_bm=zz; path=/" }, { "set-cookie", "_puid=user-abc:17; path=/" } });
        UpstreamPuidFetcher        fetcher(transport, kApiOrigin);
        std::optional<std::string> puid;
        auto                       st = run_on(wq, fetcher.fetch("Bearer tok", puid));
        failures += check(st && st->ok(), "model listing fetch succeeds");
        failures += check(puid == std::string("user-abc:17"), "puid taken from the second Set-Cookie");
        failures += check(transport.sent.size() == 1 && transport.sent[0].method == "GET", "one GET issued");
        if (!transport.sent.empty()) {
            failures += check(transport.sent[0].url == std::string(kApiOrigin) + kModelsPath, "model listing url");
            failures += check(find_header(transport.sent[0].headers, "authorization") == std::string("Bearer tok"),
                              "credential sent once with its scheme");
        }
    }
    {
        workqueue<SpinLock> wq;
        test::FakeTransport transport;
        transport.route(kApiOrigin, 200, "{}");
        UpstreamPuidFetcher        fetcher(transport, kApiOrigin);
        std::optional<std::string> puid;
        auto                       st = run_on(wq, fetcher.fetch("tok", puid));
        failures += check(st && st->ok() && !puid, "no _puid cookie means no session id");
    }
    {
        workqueue<SpinLock> wq;
        test::FakeTransport transport;
        transport.route(kApiOrigin, 401, "{}");
        UpstreamPuidFetcher        fetcher(transport, kApiOrigin);
        std::optional<std::string> puid;
        auto                       st = run_on(wq, fetcher.fetch("tok", puid));
        failures += check(st && st->kind == ErrorKind::SessionIdFailed, "non-2xx listing is SessionIdFailed");
        failures += check(st && st->upstream_status == 401, "listing status carried");
    }
    return failures;
}

int test_cache_store()
{
    int                 failures = 0;
    workqueue<SpinLock> wq;
    test::Gate          gate;
    gate.open = true;
    test::GatedPuidFetcher fetcher(gate, "puid-1");
    {
        PuidCache cache(wq, fetcher, std::chrono::seconds(3600));
        cache.store("k", "v");
        failures += check(cache.lookup("k") == std::string("v"), "stored value is returned");
        failures += check(!cache.lookup("other"), "unknown key misses");

        std::optional<std::string> sid;
        auto                       st = run_on(wq, cache.get_or_init("tok", "gpt-4", "k", sid));
        failures += check(st && st->ok() && sid == std::string("v"), "cached value short-circuits acquisition");
        failures += check(fetcher.calls == 0, "cached value makes no fetch");

        st = run_on(wq, cache.get_or_init("tok", "gpt-3.5-turbo", "k2", sid));
        failures += check(st && st->ok() && !sid, "gpt-3.5 models get no session id");
        st = run_on(wq, cache.get_or_init("tok", "mystery", "k2", sid));
        failures += check(st && st->ok() && !sid, "unknown models get no session id");
        failures += check(fetcher.calls == 0, "non gpt-4 models never fetch");

        st = run_on(wq, cache.get_or_init("tok", "gpt-4", "k2", sid));
        failures += check(st && st->ok() && sid == std::string("puid-1"), "gpt-4 miss acquires");
        failures += check(fetcher.calls == 1 && fetcher.last_credential == "tok", "fetcher called with credential");
        failures += check(cache.lookup("k2") == std::string("puid-1"), "acquired value is stored");

        st = run_on(wq, cache.get_or_init("tok", "gpt-4-mobile", "k2", sid));
        failures += check(st && st->ok() && fetcher.calls == 1, "second call served from the store");

        std::string long_token(200, 't');
        std::string long_key(200, 'k');
        st = run_on(wq, cache.get_or_init(long_token, "gpt-4", long_key, sid));
        failures += check(st && st->ok() && sid == std::string("puid-1"), "heap-sized credential and key acquire");
        failures += check(fetcher.last_credential == long_token, "long credential reaches the fetcher intact");
        failures += check(cache.lookup(long_key) == std::string("puid-1"), "long key is stored");
    }
    {
        PuidCache cache(wq, fetcher, std::chrono::seconds(0));
        cache.store("k", "v");
        failures += check(!cache.lookup("k"), "expired entry misses");
        failures += check(cache.size() == 0, "expired entry is evicted on lookup");
    }
    {
        workqueue<SpinLock> wq2;
        test::FakeTransport transport;
        transport.route(kApiOrigin, 500, "oops");
        UpstreamPuidFetcher        failing(transport, kApiOrigin);
        PuidCache                  cache(wq2, failing, std::chrono::seconds(3600));
        std::optional<std::string> sid;
        auto                       st = run_on(wq2, cache.get_or_init("tok", "gpt-4", "k", sid));
        failures += check(st && st->kind == ErrorKind::SessionIdFailed, "failed acquisition propagates");
        failures += check(cache.size() == 0, "failure is not cached");
        st = run_on(wq2, cache.get_or_init("tok", "gpt-4", "k", sid));
        failures += check(transport.sent.size() == 2, "next request retries the acquisition");
    }
    return failures;
}

WorkTask<int> lead_with_owned_captures(SingleFlight<int>& flight, std::string first, std::string second)
{
    auto factory = [first, second]() { return ready_value(static_cast<int>(first.size() + second.size())); };
    int  value   = co_await flight.run(first, factory);
    co_return value;
}

int test_single_flight_owned_captures()
{
    int                 failures = 0;
    workqueue<SpinLock> wq;
    SingleFlight<int>   flight(wq);
    auto value = run_on(wq, lead_with_owned_captures(flight, std::string(40, 'a'), std::string(26, 'b')));
    failures += check(value == 66, "factory capturing strings by value runs once and yields its result");
    failures += check(flight.in_flight() == 0, "flight released after a by-value factory");
    value = run_on(wq, lead_with_owned_captures(flight, std::string(40, 'a'), std::string(2, 'c')));
    failures += check(value == 42, "key reused after the previous flight completed");
    return failures;
}

int test_single_flight()
{
    int failures = 0;
    {
        workqueue<SpinLock>            wq;
        SingleFlight<int>              flight(wq);
        test::Gate                     gate;
        int                            factory_calls = 0;
        std::vector<std::optional<int>> results(4);
        for (auto& out : results) {
            auto root = test::capture(flight.run("k", [&]() {
                ++factory_calls;
                return gated_value(gate, 42);
            }),
                                      out);
            post_to(root, wq);
        }
        test::drain(wq);
        failures += check(factory_calls == 1, "one leader for concurrent callers");
        failures += check(flight.in_flight() == 1, "one flight registered");
        gate.release();
        test::drain(wq);
        bool all = true;
        for (const auto& out : results)
            all = all && out == 42;
        failures += check(all, "every caller observes the leader's value");
        failures += check(flight.in_flight() == 0, "flight removed after completion");

        auto later = run_on(wq, flight.run("k", [&]() {
            ++factory_calls;
            return ready_value(7);
        }));
        failures += check(later == 7 && factory_calls == 2, "a call after completion starts a new flight");
    }
    {
        workqueue<SpinLock> wq;
        SingleFlight<int>   flight(wq);
        test::Gate          gate;
        int                 factory_calls = 0;
        std::optional<int>  leader_out;
        std::optional<int>  waiter_out;
        {
            auto leader = test::capture(flight.run("k", [&]() {
                ++factory_calls;
                return gated_value(gate, 1);
            }),
                                        leader_out);
            leader.get().resume();
            failures += check(flight.in_flight() == 1, "leader parked in flight");

            auto waiter = test::capture(flight.run("k", [&]() {
                ++factory_calls;
                return ready_value(7);
            }),
                                        waiter_out);
            post_to(waiter, wq);
            test::drain(wq);
            failures += check(!waiter_out, "waiter parks behind the leader");
        }
        // the leader's frame is gone; its waiter must not hang
        test::drain(wq);
        failures += check(!leader_out, "abandoned leader produced nothing");
        failures += check(waiter_out == 7, "waiter retried and led a new flight");
        failures += check(factory_calls == 2, "factory ran again after abandonment");
        failures += check(flight.in_flight() == 0, "no flight left behind");
    }
    return failures;
}

int test_concurrent_conversations()
{
    int                  failures = 0;
    workqueue<SpinLock>  wq;
    test::Gate           gate;
    test::GatedPuidFetcher fetcher(gate, "shared-puid");
    PuidCache            cache(wq, fetcher, std::chrono::seconds(3600));
    test::FakeTransport  upstream;
    upstream.route(std::string(kApiOrigin) + kSentinelPath, 200, R"({"token":"s"})");
    test::FakeBroker     broker;
    SentinelTokenFetcher sentinel(upstream, kApiOrigin);
    HeaderConverter      converter;

    ProxyContext ctx;
    ctx.upstream         = &upstream;
    ctx.arkose_client    = &upstream;
    ctx.broker           = &broker;
    ctx.session_cache    = &cache;
    ctx.sentinel         = &sentinel;
    ctx.header_converter = &converter;
    ConversationRewriter conv(ctx);

    constexpr size_t                   kRequests = 5;
    std::vector<InboundRequest>        requests(kRequests);
    std::vector<std::optional<Status>> results(kRequests);
    for (size_t i = 0; i < kRequests; ++i) {
        requests[i].method = "POST";
        requests[i].path   = "/backend-api/conversation";
        requests[i].headers.push_back({ "authorization", "Bearer same-token" });
        requests[i].body = std::string(R"({"model":"gpt-4"})");
        requests[i].jar  = std::make_shared<CookieJar>();
        auto root        = test::capture(conv.rewrite(requests[i]), results[i]);
        post_to(root, wq);
    }
    test::drain(wq);
    failures += check(fetcher.calls == 1, "concurrent requests start one acquisition");

    gate.release();
    test::drain(wq);
    failures += check(fetcher.calls == 1, "still one acquisition after completion");

    bool all_ok = true;
    bool same   = true;
    for (size_t i = 0; i < kRequests; ++i) {
        all_ok = all_ok && results[i] && results[i]->ok();
        same   = same && find_header(requests[i].headers, "cookie") == std::string("_puid=shared-puid;");
    }
    failures += check(all_ok, "every concurrent request succeeds");
    failures += check(same, "every concurrent request carries the same session cookie");
    failures += check(cache.lookup(reduce_key("same-token")) == std::string("shared-puid"), "value cached once");
    return failures;
}

int test_remote_broker()
{
    int failures = 0;
    {
        workqueue<SpinLock> wq;
        test::FakeTransport solver;
        solver.route("http://solver.local/token", 200, R"({"token":"T1"})");
        RemoteChallengeBroker broker("http://solver.local/token");
        ChallengeRequest      request { &solver, ChallengeType::Gpt4, std::string("abc") };
        std::string           token;
        auto                  st = run_on(wq, broker.acquire(request, token));
        failures += check(st && st->ok() && token == "T1", "solver token returned");
        if (solver.sent.size() == 1) {
            auto payload = nlohmann::json::parse(solver.sent[0].body.value_or("{}"));
            failures += check(solver.sent[0].method == "POST", "solver called with POST");
            failures += check(payload["type"] == "gpt4", "payload names the challenge type");
            failures += check(payload["pk"] == "35536E1E-65B4-4D96-9D97-6ADB7EFF8147", "payload carries the public key");
            failures += check(payload["identifier"] == "abc", "payload carries the identifier");
        } else {
            failures += check(false, "solver called exactly once");
        }

        ChallengeRequest platform { &solver, ChallengeType::Platform, std::nullopt };
        st = run_on(wq, broker.acquire(platform, token));
        failures += check(st && st->ok(), "platform token returned");
        if (solver.sent.size() == 2) {
            auto payload = nlohmann::json::parse(solver.sent[1].body.value_or("{}"));
            failures += check(payload["identifier"].is_null(), "absent identifier is null");
            failures += check(payload["pk"] == "23AAD243-4799-4A9E-B01D-1166C5DE02DF", "platform public key");
        }
    }
    {
        workqueue<SpinLock> wq;
        test::FakeTransport solver;
        solver.route("http://solver.local/", 503, "busy");
        solver.route("http://solver.local/empty", 200, R"({"error":"no"})");
        std::string token;

        RemoteChallengeBroker busy("http://solver.local/token");
        auto st = run_on(wq, busy.acquire(ChallengeRequest { &solver, ChallengeType::Gpt3, std::nullopt }, token));
        failures += check(st && st->kind == ErrorKind::ChallengeFailed, "solver 503 is ChallengeFailed");
        failures += check(st && st->upstream_status == 503, "solver status carried");

        RemoteChallengeBroker empty("http://solver.local/empty");
        st = run_on(wq, empty.acquire(ChallengeRequest { &solver, ChallengeType::Gpt3, std::nullopt }, token));
        failures += check(st && st->kind == ErrorKind::ChallengeFailed, "reply without token is ChallengeFailed");

        RemoteChallengeBroker unset("");
        st = run_on(wq, unset.acquire(ChallengeRequest { &solver, ChallengeType::Gpt3, std::nullopt }, token));
        failures += check(st && st->kind == ErrorKind::ChallengeFailed, "unconfigured solver is ChallengeFailed");
    }
    failures += check(std::string(public_key(ChallengeType::Gpt3)) == "3D86FBBA-9D22-402A-B512-3420086BA6CC",
                      "gpt3 public key");
    failures += check(std::string(public_key(ChallengeType::Auth)) == public_key(ChallengeType::SignUp),
                      "auth and signup share a key");
    return failures;
}

} // namespace

int main()
{
    convgate::log::set_level(spdlog::level::warn);

    int failures = 0;
    failures += test_reduce_key();
    failures += test_set_cookie_parsing();
    failures += test_upstream_fetcher();
    failures += test_cache_store();
    failures += test_single_flight();
    failures += test_single_flight_owned_captures();
    failures += test_concurrent_conversations();
    failures += test_remote_broker();

    if (failures == 0)
        std::fprintf(stdout, "session_cache_test: all checks passed\n");
    return failures == 0 ? 0 : 1;
}
