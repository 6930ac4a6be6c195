#pragma once

#include "previous_awaiter.hpp"
#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

#ifndef CONVGATE_USE_EXCEPTION
#define CONVGATE_USE_EXCEPTION 1
#endif

namespace convgate {

struct Promise_base {
    using on_completed_t = void (*)(Promise_base&);

    auto initial_suspend() noexcept { return std::suspend_always(); }

    struct FinalAwaiter {
        Promise_base*           self;
        bool                    await_ready() const noexcept { return false; }
        std::coroutine_handle<> await_suspend(std::coroutine_handle<>) const noexcept
        {
            auto previous     = self->mPrevious;
            auto on_completed = self->mOnCompleted;
            if (on_completed) {
                on_completed(*self);
            }
            return previous ? previous : std::noop_coroutine();
        }
        void await_resume() const noexcept { }
    };

    auto final_suspend() noexcept { return FinalAwaiter { this }; }

    void unhandled_exception() noexcept
    {
#if CONVGATE_USE_EXCEPTION
        mException = std::current_exception();
#else
        std::terminate();
#endif
    }

    void rethrow_if_failed()
    {
#if CONVGATE_USE_EXCEPTION
        if (mException) [[unlikely]] {
            std::rethrow_exception(std::exchange(mException, nullptr));
        }
#endif
    }

    std::coroutine_handle<> mPrevious {};
    on_completed_t          mOnCompleted { nullptr };
    void*                   mUserData { nullptr }; // opaque slot for whoever installs mOnCompleted
#if CONVGATE_USE_EXCEPTION
    std::exception_ptr mException {};
#endif
};

template <class T> struct Promise : Promise_base {

    void return_value(T&& ret) { mResult.emplace(std::move(ret)); }

    void return_value(T const& ret) { mResult.emplace(ret); }

    T result()
    {
        rethrow_if_failed();
        return std::move(*mResult);
    }

    auto get_return_object() { return std::coroutine_handle<Promise>::from_promise(*this); }

    std::optional<T> mResult;

    Promise& operator=(Promise&&) = delete;
};

template <> struct Promise<void> : Promise_base {
    void return_void() noexcept { }

    void result() { rethrow_if_failed(); }

    auto get_return_object() { return std::coroutine_handle<Promise>::from_promise(*this); }

    Promise& operator=(Promise&&) = delete;
};

/**
 * @brief Lazily started coroutine. Awaiting it starts the body and resumes the awaiter
 * through symmetric transfer when the body finishes.
 */
template <class T = void, class P = Promise<T>> struct [[nodiscard]] Task {
    using promise_type = P;

    Task(std::coroutine_handle<promise_type> coroutine = nullptr) noexcept : mCoroutine(coroutine) { }

    Task(Task&& that) noexcept : mCoroutine(that.mCoroutine) { that.mCoroutine = nullptr; }

    Task& operator=(Task&& that) noexcept
    {
        std::swap(mCoroutine, that.mCoroutine);
        return *this;
    }

    ~Task()
    {
        if (mCoroutine)
            mCoroutine.destroy();
    }

    std::coroutine_handle<promise_type> detach() noexcept { return std::exchange(mCoroutine, nullptr); }

    std::coroutine_handle<promise_type> get() const noexcept { return mCoroutine; }

    struct Awaiter {
        bool await_ready() const noexcept { return false; }

        std::coroutine_handle<promise_type> await_suspend(std::coroutine_handle<> coroutine) const noexcept
        {
            promise_type& promise = mCoroutine.promise();
            promise.mPrevious     = coroutine;
            return mCoroutine;
        }

        T await_resume() const { return mCoroutine.promise().result(); }

        std::coroutine_handle<promise_type> mCoroutine;
    };

    auto operator co_await() const noexcept { return Awaiter(mCoroutine); }

    operator std::coroutine_handle<promise_type>() const noexcept { return mCoroutine; }

    std::coroutine_handle<promise_type> mCoroutine;
};

} // namespace convgate
