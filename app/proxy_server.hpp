#pragma once

#include "../net/epoll_reactor.hpp"
#include "../net/tcp_listener.hpp"
#include "../proxy/dispatcher.hpp"
#include "../task/worker.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace convgate::app {

/**
 * @brief Listening front end. Each accepted connection carries one HTTP/1.1 request: it is parsed,
 * dispatched, answered with the buffered reply and closed.
 */
class ProxyServer {
public:
    ProxyServer(workqueue<SpinLock>&           exec,
                net::epoll_reactor<SpinLock>&  reactor,
                proxy::RequestDispatcher&      dispatcher,
                std::string                    origin,
                size_t                         max_body_bytes = 16 * 1024 * 1024);

    ProxyServer(const ProxyServer&)            = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    // @throws std::runtime_error when the address cannot be bound.
    void bind(const std::string& host, uint16_t port);

    // Accept loop; returns once stop() closed the listener.
    WorkTask<void> serve();

    void stop();

    int active_connections() const { return active_.load(std::memory_order_acquire); }

private:
    WorkTask<void> handle_connection(int fd, uint64_t id);

    workqueue<SpinLock>&           exec_;
    net::epoll_reactor<SpinLock>&  reactor_;
    proxy::RequestDispatcher&      dispatcher_;
    std::string                    origin_;
    size_t                         max_body_bytes_;
    net::tcp_listener<SpinLock>    listener_;
    std::atomic_int                active_ { 0 };
    std::atomic<uint64_t>          next_id_ { 1 };
};

} // namespace convgate::app
