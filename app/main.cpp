#include "options.hpp"
#include "proxy_server.hpp"
#include "runtime.hpp"

#include "../net/epoll_reactor.hpp"
#include "../net/http/upstream_client.hpp"
#include "../proxy/challenge.hpp"
#include "../proxy/context.hpp"
#include "../proxy/dispatcher.hpp"
#include "../proxy/header_converter.hpp"
#include "../proxy/local_api.hpp"
#include "../proxy/sentinel.hpp"
#include "../proxy/session_cache.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <thread>

using namespace convgate;

namespace {

std::atomic_bool g_stop_requested { false };

void on_stop_signal(int)
{
    g_stop_requested.store(true, std::memory_order_release);
}

bool setup_logging(const app::ProxyOptions& options)
{
    if (!options.log_file.empty()) {
        std::filesystem::path path(options.log_file);
        auto                  parent = path.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                std::fprintf(stderr, "[server] failed to create log directory %s: %s\n", parent.string().c_str(),
                             ec.message().c_str());
            }
        }
        try {
            log::configure_file_logging(path.string(), options.log_truncate, true);
        } catch (const spdlog::spdlog_ex& ex) {
            std::fprintf(stderr, "[server] failed to open log file %s: %s\n", options.log_file.c_str(), ex.what());
            return false;
        }
    }
    log::set_level(options.log_level);
    if (!options.log_file.empty())
        CONVGATE_LOG_INFO("[server] logging to %s (truncate=%d)", options.log_file.c_str(), options.log_truncate ? 1 : 0);
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    app::ProxyOptions options;
    std::string       error;
    switch (app::parse_options(argc, argv, options, error)) {
    case app::ParseOutcome::Help:
        app::print_usage(argv[0]);
        return 0;
    case app::ParseOutcome::Error:
        std::fprintf(stderr, "%s\n", error.c_str());
        app::print_usage(argv[0]);
        return 2;
    case app::ParseOutcome::Run:
        break;
    }

    if (!setup_logging(options))
        return 1;
    if (options.arkose_endpoint.empty())
        CONVGATE_LOG_WARN("[server] no --arkose-endpoint given, requests needing a challenge token will fail");

    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);
    std::signal(SIGPIPE, SIG_IGN);

    app::Executor exec;
    exec.start(options.threads);

    int exit_code = 0;
    try {
        net::epoll_reactor<SpinLock> reactor(exec);

        net::http::UpstreamClientOptions client_options;
        client_options.verify_peer = options.verify_peer;
        net::http::UpstreamHttpClient upstream(reactor, client_options);

        proxy::RemoteChallengeBroker broker(options.arkose_endpoint);
        proxy::SentinelTokenFetcher  sentinel(upstream, options.api_origin);
        proxy::UpstreamPuidFetcher   puid_fetcher(upstream, options.api_origin);
        proxy::PuidCache             session_cache(exec, puid_fetcher, options.puid_ttl);
        proxy::HeaderConverter       converter;
        proxy::ApiKeyShortCircuit    local_api;

        proxy::ProxyContext ctx;
        ctx.upstream               = &upstream;
        ctx.arkose_client          = &upstream;
        ctx.broker                 = &broker;
        ctx.session_cache          = &session_cache;
        ctx.sentinel               = &sentinel;
        ctx.header_converter       = &converter;
        ctx.local_api              = &local_api;
        ctx.arkose_gpt3_experiment = options.arkose_gpt3_experiment;

        proxy::RequestDispatcher dispatcher(ctx);
        app::ProxyServer         server(exec, reactor, dispatcher, options.origin);
        server.bind(options.host, options.port);

        auto             serve_task = server.serve();
        std::atomic_bool finished { false };
        auto&            promise = serve_task.get().promise();
        promise.mUserData        = &finished;
        promise.mOnCompleted     = [](Promise_base& pb) {
            auto* flag = static_cast<std::atomic_bool*>(pb.mUserData);
            if (flag)
                flag->store(true, std::memory_order_release);
        };
        post_to(serve_task, exec);

        while (!g_stop_requested.load(std::memory_order_acquire) && !finished.load(std::memory_order_acquire))
            std::this_thread::sleep_for(std::chrono::milliseconds(50));

        CONVGATE_LOG_INFO("[server] stopping");
        server.stop();
        app::wait_until(finished);

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (server.active_connections() > 0 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (int left = server.active_connections(); left > 0)
            CONVGATE_LOG_WARN("[server] exiting with %d connection(s) still open", left);

        exec.stop_and_join();
    } catch (const std::exception& ex) {
        CONVGATE_LOG_ERROR("[server] fatal: %s", ex.what());
        exit_code = 1;
    }

    exec.stop_and_join();
    spdlog::default_logger_raw()->flush();
    return exit_code;
}
