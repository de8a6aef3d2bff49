#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace sc {

constexpr size_t MAX_POOL_THREADS = 64;

// Configured worker count: values > 0 are taken as-is (capped), 0 or less
// uses the hardware core count. Always in [1, MAX_POOL_THREADS].
size_t resolveThreadCount(int configured);

// Fixed-size worker pool. A pool is owned by exactly one optimization run;
// nothing is shared between runs.
class ThreadPool {
  public:
    explicit ThreadPool(size_t numThreads);

    // Runs the remaining queued tasks, then joins
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Exceptions thrown by the task are rethrown from future::get().
    // Throws std::runtime_error after shutdown.
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> future = task->get_future();
        if (!enqueue([task] { (*task)(); })) {
            throw std::runtime_error("ThreadPool: submit after shutdown");
        }
        return future;
    }

    // Calls fn(i) for every i in [0, count) and waits for all of them. Once
    // every call has finished, the failure with the lowest index is rethrown.
    void runAll(size_t count, const std::function<void(size_t)>& fn);

    void shutdown();

    size_t threadCount() const { return m_workers.size(); }

  private:
    bool enqueue(std::function<void()> task);
    void workerLoop();

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_taskQueue;
    std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_shutdown = false;
};

} // namespace sc
