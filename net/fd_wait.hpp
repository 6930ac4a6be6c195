// fd_wait.hpp - awaiters for fd readiness (read/write)
#pragma once
#include "epoll_reactor.hpp"
#include "io_waiter.hpp"
#include <sys/epoll.h>

namespace convgate::net {

template <lockable Lock> struct fd_wait_awaiter : io_waiter_base {
    epoll_reactor<Lock>& reactor;
    int                  fd;
    uint32_t             mask;

    fd_wait_awaiter(epoll_reactor<Lock>& r, int f, uint32_t m) : reactor(r), fd(f), mask(m) { }
    bool await_ready() const noexcept { return fd < 0; }
    void await_suspend(std::coroutine_handle<> coroutine)
    {
        this->h = coroutine;
        reactor.add_waiter(fd, mask, this);
    }
    uint32_t await_resume() const noexcept { return mask; }
};

template <lockable Lock> inline fd_wait_awaiter<Lock> fd_wait_read(epoll_reactor<Lock>& reactor, int fd)
{
    return fd_wait_awaiter<Lock>(reactor, fd, EPOLLIN);
}

template <lockable Lock> inline fd_wait_awaiter<Lock> fd_wait_write(epoll_reactor<Lock>& reactor, int fd)
{
    return fd_wait_awaiter<Lock>(reactor, fd, EPOLLOUT);
}

} // namespace convgate::net
