#pragma once

/**
 * @file tcp_stream.hpp
 * @brief Coroutine TCP stream: connect / recv / send_all over a non-blocking fd.
 *
 * Every operation returns a non-negative count on success and a negative errno on failure.
 */

#include "epoll_reactor.hpp"
#include "fd_wait.hpp"
#include "worker.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

namespace convgate::net {

inline int set_non_block(int fd)
{
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0)
        return -errno;
    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        return -errno;
    return 0;
}

/**
 * @brief Resolve @p host with a blocking getaddrinfo and copy the first stream address.
 * @return 0 on success, -EHOSTUNREACH when nothing resolves.
 */
inline int resolve_endpoint(const std::string& host, uint16_t port, sockaddr_storage& storage, socklen_t& len)
{
    std::string node = host;
    if (node.size() >= 2 && node.front() == '[' && node.back() == ']')
        node = node.substr(1, node.size() - 2);
    if (node.empty())
        return -EINVAL;

    addrinfo hints {};
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    hints.ai_family   = AF_UNSPEC;

    char service[16] {};
    std::snprintf(service, sizeof(service), "%u", static_cast<unsigned>(port));

    addrinfo* result = nullptr;
    int       rc     = ::getaddrinfo(node.c_str(), service, &hints, &result);
    if (rc != 0 || !result) {
        CONVGATE_LOG_WARN("[net] getaddrinfo(%s) failed: %s", node.c_str(), ::gai_strerror(rc));
        return -EHOSTUNREACH;
    }

    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(result, ::freeaddrinfo);
    for (auto* ai = result; ai; ai = ai->ai_next) {
        if (ai->ai_addrlen > sizeof(storage))
            continue;
        std::memcpy(&storage, ai->ai_addr, ai->ai_addrlen);
        len = static_cast<socklen_t>(ai->ai_addrlen);
        return 0;
    }
    return -EHOSTUNREACH;
}

template <lockable Lock> class tcp_stream {
public:
    using task_int   = Task<int, Work_Promise<Lock, int>>;
    using task_ssize = Task<ssize_t, Work_Promise<Lock, ssize_t>>;

    explicit tcp_stream(epoll_reactor<Lock>& reactor) : _reactor(&reactor) { }

    // Adopt an accepted fd.
    tcp_stream(int fd, epoll_reactor<Lock>& reactor) : _reactor(&reactor), _fd(fd)
    {
        if (_fd >= 0) {
            set_non_block(_fd);
            _reactor->add_fd(_fd);
        }
    }

    tcp_stream(const tcp_stream&)            = delete;
    tcp_stream& operator=(const tcp_stream&) = delete;
    tcp_stream(tcp_stream&& o) noexcept : _reactor(o._reactor), _fd(std::exchange(o._fd, -1)) { }
    tcp_stream& operator=(tcp_stream&& o) noexcept
    {
        if (this != &o) {
            close();
            _reactor = o._reactor;
            _fd      = std::exchange(o._fd, -1);
        }
        return *this;
    }
    ~tcp_stream() { close(); }

    int                  native_handle() const noexcept { return _fd; }
    bool                 is_open() const noexcept { return _fd >= 0; }
    epoll_reactor<Lock>& reactor() { return *_reactor; }

    void close()
    {
        if (_fd >= 0) {
            int fd = std::exchange(_fd, -1);
            _reactor->remove_fd(fd);
            ::close(fd);
        }
    }

    void shutdown_tx()
    {
        if (_fd >= 0)
            ::shutdown(_fd, SHUT_WR);
    }

    task_int connect(std::string host, uint16_t port)
    {
        sockaddr_storage addr {};
        socklen_t        len = 0;
        int              rc  = resolve_endpoint(host, port, addr, len);
        if (rc < 0)
            co_return rc;

        close();
        int fd = ::socket(addr.ss_family, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
        if (fd < 0)
            co_return -errno;
        _fd = fd;
        _reactor->add_fd(_fd);
        int one = 1;
        ::setsockopt(_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        if (::connect(_fd, reinterpret_cast<sockaddr*>(&addr), len) == 0)
            co_return 0;
        if (errno != EINPROGRESS)
            co_return -errno;

        co_await fd_wait_write(*_reactor, _fd);
        if (_fd < 0)
            co_return -ECANCELED;

        int       err     = 0;
        socklen_t err_len = sizeof(err);
        if (::getsockopt(_fd, SOL_SOCKET, SO_ERROR, &err, &err_len) != 0)
            co_return -errno;
        co_return err == 0 ? 0 : -err;
    }

    // Read at least one byte; 0 means the peer closed.
    task_ssize recv(void* buf, size_t len)
    {
        for (;;) {
            if (_fd < 0)
                co_return -EBADF;
            ssize_t n = ::recv(_fd, buf, len, 0);
            if (n >= 0)
                co_return n;
            int e = errno;
            if (e == EINTR)
                continue;
            if (e != EAGAIN && e != EWOULDBLOCK)
                co_return -e;
            co_await fd_wait_read(*_reactor, _fd);
        }
    }

    task_ssize send_all(const void* buf, size_t len)
    {
        auto*  p    = static_cast<const char*>(buf);
        size_t sent = 0;
        while (sent < len) {
            if (_fd < 0)
                co_return -EBADF;
            ssize_t n = ::send(_fd, p + sent, len - sent, MSG_NOSIGNAL);
            if (n > 0) {
                sent += static_cast<size_t>(n);
                continue;
            }
            int e = errno;
            if (n < 0 && e == EINTR)
                continue;
            if (n < 0 && e != EAGAIN && e != EWOULDBLOCK)
                co_return -e;
            co_await fd_wait_write(*_reactor, _fd);
        }
        co_return static_cast<ssize_t>(sent);
    }

private:
    epoll_reactor<Lock>* _reactor { nullptr };
    int                  _fd { -1 };
};

} // namespace convgate::net
