#pragma once
/**
 * @file eviction_scheduler.hpp
 * @brief One-shot keyed timers run on a single background thread.
 *
 * `EvictionScheduler` backs the idle-eviction timers of the ResidencyManager. Every key
 * owns at most one pending timer: scheduling a key again replaces (debounces) the earlier
 * timer. Callbacks run on the scheduler's worker thread with no scheduler lock held, so a
 * callback may call back into the scheduler.
 *
 * After `stop()` (or destruction) no callback ever fires again; a callback already
 * running when `stop()` is called finishes before `stop()` returns, unless `stop()` is
 * called from inside a callback.
 */
#include "residency_utils_export.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace residency::utils
{

class EvictionSchedulerImpl;

class RESIDENCY_UTILS_EXPORT EvictionScheduler
{
  public:
    using Callback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    EvictionScheduler();
    ~EvictionScheduler();

    EvictionScheduler(const EvictionScheduler &) = delete;
    EvictionScheduler &operator=(const EvictionScheduler &) = delete;
    EvictionScheduler(EvictionScheduler &&) = delete;
    EvictionScheduler &operator=(EvictionScheduler &&) = delete;

    /**
     * @brief `Clock::now() + delay`, saturating at `Clock::time_point::max()`.
     * @details A delay too large for the clock yields a deadline that never passes.
     *          Negative delays count as zero.
     */
    [[nodiscard]] static Clock::time_point deadline_after(std::chrono::milliseconds delay) noexcept;

    /**
     * @brief Runs `callback` once, `delay` from now, unless replaced or cancelled first.
     * @return `false` if the scheduler has been stopped (the callback is discarded).
     */
    bool schedule(std::string_view key, std::chrono::milliseconds delay, Callback callback);

    /// Cancels the pending timer for `key`. Returns whether one was pending.
    bool cancel(std::string_view key);

    /// Cancels every pending timer.
    void cancel_all();

    [[nodiscard]] bool pending(std::string_view key) const;
    [[nodiscard]] std::size_t pending_count() const;

    /// Discards all pending timers and joins the worker thread. Idempotent.
    void stop();

  private:
    std::unique_ptr<EvictionSchedulerImpl> pImpl;
};

} // namespace residency::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
