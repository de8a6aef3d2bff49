#include "thread_pool.h"

#include <algorithm>
#include <exception>

namespace sc {

namespace {

constexpr unsigned FALLBACK_CORES = 4;

} // namespace

size_t resolveThreadCount(int configured) {
    size_t count = 0;
    if (configured > 0) {
        count = static_cast<size_t>(configured);
    } else {
        unsigned cores = std::thread::hardware_concurrency();
        count = cores == 0 ? FALLBACK_CORES : cores;
    }
    return std::clamp(count, size_t(1), MAX_POOL_THREADS);
}

ThreadPool::ThreadPool(size_t numThreads) {
    numThreads = std::clamp(numThreads, size_t(1), MAX_POOL_THREADS);
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        m_workers.emplace_back([this] { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return false;
        }
        m_taskQueue.push(std::move(task));
    }
    m_condition.notify_one();
    return true;
}

void ThreadPool::runAll(size_t count, const std::function<void(size_t)>& fn) {
    std::vector<std::future<void>> pending;
    pending.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        pending.push_back(submit([&fn, i] { fn(i); }));
    }

    std::exception_ptr failure;
    for (auto& future : pending) {
        try {
            future.get();
        } catch (...) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
    }
    m_condition.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock, [this] { return m_shutdown || !m_taskQueue.empty(); });
            if (m_taskQueue.empty()) {
                return;
            }
            task = std::move(m_taskQueue.front());
            m_taskQueue.pop();
        }
        task();
    }
}

} // namespace sc
