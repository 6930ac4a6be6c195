#pragma once

#include "worker.hpp"
#include "workqueue.hpp"

#include <coroutine>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace convgate {

/**
 * @brief Keyed single-flight gate.
 *
 * The first caller for a key becomes the leader and runs the factory; callers arriving while the
 * leader is in flight park on the flight and receive a copy of the leader's result. The entry is
 * removed as soon as the leader finishes, so the next caller after completion starts a new flight.
 *
 * If the leader's coroutine is destroyed before it produces a value (its request was aborted), the
 * parked callers are woken without a result and race again for leadership.
 */
template <class T, lockable Lock = SpinLock> class SingleFlight {
    struct Flight {
        bool             done { false };
        std::optional<T> result;
        list_head        waiters;
    };

    struct join_awaiter : worknode {
        SingleFlight&           owner;
        std::shared_ptr<Flight> flight;
        std::coroutine_handle<> h;

        join_awaiter(SingleFlight& o, std::shared_ptr<Flight> f) : owner(o), flight(std::move(f))
        {
            INIT_LIST_HEAD(&ws_node);
        }
        join_awaiter(const join_awaiter&)            = delete;
        join_awaiter& operator=(const join_awaiter&) = delete;

        ~join_awaiter()
        {
            std::scoped_lock<Lock> lk(owner._lk);
            if (!flight->done)
                list_del(&ws_node);
        }

        static void resume_cb(struct worknode* w)
        {
            auto* self = static_cast<join_awaiter*>(w);
            if (self->h)
                self->h.resume();
        }

        bool await_ready() const noexcept { return false; }

        bool await_suspend(std::coroutine_handle<> coroutine)
        {
            h    = coroutine;
            func = &join_awaiter::resume_cb;
            std::scoped_lock<Lock> lk(owner._lk);
            if (flight->done)
                return false;
            list_add_tail(&ws_node, &flight->waiters);
            return true;
        }

        std::optional<T> await_resume() const { return flight->result; }
    };

    struct leader_guard {
        SingleFlight&           owner;
        std::string             key;
        std::shared_ptr<Flight> flight;
        bool                    finished { false };

        void complete(const T& value)
        {
            finished = true;
            owner.finish(key, flight, &value);
        }

        ~leader_guard()
        {
            if (!finished)
                owner.finish(key, flight, nullptr);
        }
    };

public:
    explicit SingleFlight(workqueue<Lock>& exec) : _exec(exec) { }
    SingleFlight(const SingleFlight&)            = delete;
    SingleFlight& operator=(const SingleFlight&) = delete;

    /**
     * @brief Run @p factory under the gate for @p key.
     * @param factory callable returning `WorkTask<T>`; invoked only by the leader.
     */
    template <class Factory> WorkTask<T> run(std::string key, Factory factory)
    {
        for (;;) {
            std::shared_ptr<Flight> flight;
            bool                    leader = false;
            {
                std::scoped_lock<Lock> lk(_lk);
                auto                   it = _flights.find(key);
                if (it == _flights.end()) {
                    flight = std::make_shared<Flight>();
                    _flights.emplace(key, flight);
                    leader = true;
                } else {
                    flight = it->second;
                }
            }

            if (leader) {
                leader_guard guard { *this, key, flight };
                T            value = co_await factory();
                guard.complete(value);
                co_return value;
            }

            auto shared = co_await join_awaiter(*this, flight);
            if (shared)
                co_return std::move(*shared);
            CONVGATE_LOG_DEBUG("[single_flight] leader abandoned key, retrying");
        }
    }

    size_t in_flight() const
    {
        std::scoped_lock<Lock> lk(_lk);
        return _flights.size();
    }

private:
    void finish(const std::string& key, const std::shared_ptr<Flight>& flight, const T* value)
    {
        list_head batch;
        INIT_LIST_HEAD(&batch);
        {
            std::scoped_lock<Lock> lk(_lk);
            flight->done = true;
            if (value)
                flight->result = *value;
            auto it = _flights.find(key);
            if (it != _flights.end() && it->second == flight)
                _flights.erase(it);
            list_splice_tail_init(&flight->waiters, &batch);
        }
        _exec.post(batch);
    }

    workqueue<Lock>&                                         _exec;
    mutable Lock                                             _lk;
    std::unordered_map<std::string, std::shared_ptr<Flight>> _flights;
};

} // namespace convgate
