#include "runtime.hpp"

#include <chrono>

namespace convgate::app {

Executor::Executor()
{
    trig = [](workqueue<SpinLock>* wq) {
        auto* self = static_cast<Executor*>(wq);
        self->cv_.notify_one();
    };
}

Executor::~Executor()
{
    stop_and_join();
}

worknode* Executor::get_work_node(workqueue<SpinLock>& wq)
{
    // called by work_once with lk held; the wait releases it while sleeping
    for (;;) {
        if (stopping_.load(std::memory_order_acquire))
            return nullptr;
        worknode* node = workqueue<SpinLock>::get_work_node(wq);
        if (node)
            return node;
        cv_.wait(lk, [&]() { return stopping_.load(std::memory_order_acquire) || !list_empty(&wq.ws_head); });
    }
}

void Executor::start(int n)
{
    if (!workers_.empty())
        return;
    if (n <= 0) {
        unsigned hc = std::thread::hardware_concurrency();
        n           = hc == 0 ? 1 : static_cast<int>(hc);
    }
    workers_.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        workers_.emplace_back([this]() {
            while (!stopping_.load(std::memory_order_acquire))
                (void)this->work_once();
        });
    }
    CONVGATE_LOG_DEBUG("[server] executor started with %d worker(s)", n);
}

void Executor::stop_and_join()
{
    stopping_.store(true, std::memory_order_release);
    lk.lock();
    lk.unlock();
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable())
            t.join();
    }
    workers_.clear();
}

void wait_until(const std::atomic_bool& flag)
{
    while (!flag.load(std::memory_order_acquire))
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
}

} // namespace convgate::app
