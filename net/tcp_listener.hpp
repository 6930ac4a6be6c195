/**
 * @file tcp_listener.hpp
 * @brief TCP listener with coroutine accept.
 */
#pragma once

#include "epoll_reactor.hpp"
#include "fd_wait.hpp"
#include "tcp_stream.hpp"
#include "worker.hpp"
#include <arpa/inet.h>
#include <stdexcept>
#include <string>

namespace convgate::net {

// accept() result for errors that retrying will not fix.
inline constexpr int k_accept_fatal = -2;

template <lockable Lock> class tcp_listener {
public:
    explicit tcp_listener(epoll_reactor<Lock>& reactor) : _reactor(reactor) { }
    tcp_listener(const tcp_listener&)            = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;
    ~tcp_listener() { close(); }

    /**
     * @brief Bind and listen.
     * @param host IPv4 address, "0.0.0.0" or empty for INADDR_ANY.
     * @throws std::runtime_error when the socket cannot be bound.
     */
    void bind_listen(const std::string& host, uint16_t port, int backlog = 128)
    {
        close();
        _fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
        if (_fd < 0)
            throw std::runtime_error("socket failed");
        sockaddr_in addr {};
        addr.sin_family = AF_INET;
        addr.sin_port   = htons(port);
        if (host.empty() || host == "0.0.0.0")
            addr.sin_addr.s_addr = INADDR_ANY;
        else if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0)
            throw std::runtime_error("inet_pton failed: " + host);
        int opt = 1;
        ::setsockopt(_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        if (::bind(_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
            throw std::runtime_error("bind failed: " + host + ":" + std::to_string(port));
        if (::listen(_fd, backlog) < 0)
            throw std::runtime_error("listen failed");
        _reactor.add_fd(_fd);
    }

    int native_handle() const noexcept { return _fd; }

    void close()
    {
        if (_fd >= 0) {
            int fd = std::exchange(_fd, -1);
            _reactor.remove_fd(fd);
            ::close(fd);
        }
    }

    /**
     * @brief Wait for a connection.
     * @return the accepted fd, or `k_accept_fatal`.
     */
    Task<int, Work_Promise<Lock, int>> accept()
    {
        for (;;) {
            if (_fd < 0)
                co_return k_accept_fatal;
            int fd = ::accept4(_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
            if (fd >= 0)
                co_return fd;
            int e = errno;
            if (e == EINTR || e == ECONNABORTED || e == EPROTO)
                continue;
            if (e == EAGAIN || e == EWOULDBLOCK) {
                co_await fd_wait_read(_reactor, _fd);
                continue;
            }
            CONVGATE_LOG_ERROR("[net] accept failed errno=%d", e);
            co_return k_accept_fatal;
        }
    }

private:
    epoll_reactor<Lock>& _reactor;
    int                  _fd { -1 };
};

} // namespace convgate::net
