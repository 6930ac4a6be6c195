#pragma once

#include "../task/workqueue.hpp"

#include <atomic>
#include <condition_variable>
#include <thread>
#include <vector>

namespace convgate::app {

/**
 * @brief Work queue drained by a pool of worker threads that sleep while it is empty.
 */
class Executor : public workqueue<SpinLock> {
public:
    Executor();
    ~Executor() override;

    Executor(const Executor&)            = delete;
    Executor& operator=(const Executor&) = delete;

    // n <= 0 uses the hardware concurrency. Only the first call starts threads.
    void start(int n);
    void stop_and_join();

    size_t worker_count() const { return workers_.size(); }

protected:
    worknode* get_work_node(workqueue<SpinLock>& wq) override;

private:
    std::condition_variable_any cv_;
    std::atomic_bool            stopping_ { false };
    std::vector<std::thread>    workers_;
};

// Block the calling thread until @p flag becomes true.
void wait_until(const std::atomic_bool& flag);

} // namespace convgate::app
