#pragma once

#include "task.hpp"
#include "workqueue.hpp"
#include <coroutine>

namespace convgate {

/**
 * @brief Work node embedded in a coroutine frame. Posting the node resumes the coroutine on the
 * executor that drains the queue; a finished detached frame is destroyed there as well.
 */
template <lockable Lock> struct Work_promise_base : worknode {
    virtual ~Work_promise_base() = default;

    workqueue<Lock>*             _executor            = nullptr;
    bool                         _running_on_executor = false;
    bool                         _completion_posted   = false;
    Promise_base::on_completed_t _user_on_completed   = nullptr;

    void post(workqueue<Lock>* wq)
    {
        _executor = wq;
        func      = resume_cb;
        if (wq) {
            wq->post(*this);
        }
    }

    void post(void) { post(this->_executor); }

    static void resume_cb(struct worknode* work)
    {
        auto* promise = static_cast<Work_promise_base*>(work);
        auto  coro    = std::coroutine_handle<Work_promise_base>::from_promise(*promise);

        promise->_running_on_executor = true;
        if (!coro.done()) {
            coro.resume();
        }
        promise->_running_on_executor = false;

        if (coro.done()) {
            promise->_completion_posted = false;
            promise->_user_on_completed = nullptr;
            coro.destroy();
        }
    }

    Work_promise_base& operator=(Work_promise_base&&) = delete;
};

// Completion plumbing shared by the value and void promises.
template <class Derived, lockable Lock> struct Work_completion {
    static void destroy_on_executor(worknode* work)
    {
        auto* self = static_cast<Derived*>(work);
        std::coroutine_handle<Derived>::from_promise(*self).destroy();
    }

    static void on_completed_adapter(Promise_base& pb)
    {
        auto& self = static_cast<Derived&>(pb);
        if (self._user_on_completed) {
            self._user_on_completed(pb);
        }
        if (!self._completion_posted && self._executor && !self._running_on_executor) {
            self._completion_posted = true;
            self.func               = &destroy_on_executor;
            self.post(self._executor);
        }
    }

    static void prepare_for_post(Derived& promise)
    {
        if (promise.mOnCompleted != &on_completed_adapter) {
            promise._user_on_completed = promise.mOnCompleted;
            promise.mOnCompleted       = &on_completed_adapter;
        }
        promise._completion_posted = false;
    }
};

template <lockable Lock, class T = void>
struct Work_Promise : Promise<T>, Work_promise_base<Lock>, Work_completion<Work_Promise<Lock, T>, Lock> {
    auto get_return_object() { return std::coroutine_handle<Work_Promise>::from_promise(*this); }

    void return_value(T&& ret) { Promise<T>::return_value(std::move(ret)); }

    void return_value(T const& ret) { Promise<T>::return_value(ret); }
};

template <lockable Lock>
struct Work_Promise<Lock, void> : Promise<void>,
                                  Work_promise_base<Lock>,
                                  Work_completion<Work_Promise<Lock, void>, Lock> {
    auto get_return_object() { return std::coroutine_handle<Work_Promise>::from_promise(*this); }

    void return_void() noexcept { }
};

// Coroutine type used across the proxy: awaitable from another task or detached onto an executor.
template <class T = void> using WorkTask = Task<T, Work_Promise<SpinLock, T>>;

/**
 * @brief Detach @p tk and schedule its first resume on @p executor. The frame owns itself
 * afterwards and is destroyed on the executor once it finishes.
 */
template <lockable Lock, class T> static inline void post_to(Task<T, Work_Promise<Lock, T>>& tk, workqueue<Lock>& executor)
{
    auto& promise = tk.mCoroutine.promise();
    INIT_LIST_HEAD(&promise.ws_node);
    Work_Promise<Lock, T>::prepare_for_post(promise);
    tk.detach();
    promise.post(&executor);
}

} // namespace convgate
