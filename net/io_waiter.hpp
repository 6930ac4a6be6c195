// io_waiter.hpp - common waiter base for fd-based async operations
#pragma once
#include "workqueue.hpp"
#include <coroutine>

namespace convgate::net {

/**
 * @brief Base of every fd awaiter: a work node whose callback resumes the parked coroutine.
 */
struct io_waiter_base : worknode {
    std::coroutine_handle<> h;

    static void resume_cb(struct worknode* w)
    {
        auto* self = static_cast<io_waiter_base*>(w);
        if (self->h)
            self->h.resume();
    }
};

} // namespace convgate::net
