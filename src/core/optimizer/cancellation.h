#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "../types.h"
#include "errors.h"

namespace sc {
namespace optimizer {

// Cooperative stop flag owned by the caller of a run.
// Checked at generation boundaries and before opening each new bar.
class CancellationToken {
  public:
    void requestStop() { m_stop.store(true, std::memory_order_release); }
    bool stopRequested() const { return m_stop.load(std::memory_order_acquire); }

  private:
    std::atomic<bool> m_stop{false};
};

// Wall-clock budget of one run. Default-constructed deadlines never expire.
class Deadline {
  public:
    using Clock = std::chrono::steady_clock;

    Deadline() = default;

    static Deadline after(f64 milliseconds) {
        Deadline d;
        if (milliseconds > 0.0) {
            d.m_limited = true;
            const Clock::time_point now = Clock::now();
            // Budgets past the clock's range never expire
            const std::chrono::duration<f64, std::milli> headroom = Clock::time_point::max() - now;
            if (milliseconds >= headroom.count()) {
                d.m_end = Clock::time_point::max();
            } else {
                d.m_end = now + std::chrono::duration_cast<Clock::duration>(
                                    std::chrono::duration<f64, std::milli>(milliseconds));
            }
        }
        return d;
    }

    bool limited() const { return m_limited; }
    bool expired() const { return m_limited && Clock::now() >= m_end; }

  private:
    bool m_limited = false;
    Clock::time_point m_end{};
};

// What a strategy consults while it runs
struct RunControl {
    const CancellationToken* token = nullptr;
    Deadline deadline;

    bool stopRequested() const { return token != nullptr && token->stopRequested(); }

    void throwIfCancelled(const std::string& where) const {
        if (stopRequested()) {
            throw OptimizationCancelledError(where);
        }
    }
};

} // namespace optimizer
} // namespace sc
