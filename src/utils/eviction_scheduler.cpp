/*******************************************************************************
 * @file eviction_scheduler.cpp
 * @brief Min-heap timer thread with per-key replacement.
 *
 * Each `schedule()` call pushes a heap entry tagged with a fresh token and records
 * key -> token in `m_active`. Replacing or cancelling a key only rewrites / erases the
 * table entry; the old heap entry stays behind and is discarded as stale when it
 * reaches the top. This keeps schedule and cancel O(log n) without heap surgery.
 ******************************************************************************/
#include "rsd_service.hpp"

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace residency::utils
{

namespace
{
struct TimerEntry
{
    EvictionScheduler::Clock::time_point deadline;
    uint64_t token;
    std::string key;
    EvictionScheduler::Callback callback;
};

// std::*_heap builds a max-heap; invert so the earliest deadline sits on top.
// Tokens increase monotonically, so equal deadlines fire in scheduling order.
struct FiresLater
{
    bool operator()(const TimerEntry &a, const TimerEntry &b) const noexcept
    {
        if (a.deadline != b.deadline)
            return a.deadline > b.deadline;
        return a.token > b.token;
    }
};
} // namespace

class EvictionSchedulerImpl
{
  public:
    EvictionSchedulerImpl() { m_worker = std::thread(&EvictionSchedulerImpl::run, this); }

    bool schedule(std::string_view key, std::chrono::milliseconds delay,
                  EvictionScheduler::Callback callback);
    bool cancel(std::string_view key);
    void cancel_all();
    bool pending(std::string_view key) const;
    std::size_t pending_count() const;
    void stop();
    bool on_worker_thread() const noexcept
    {
        return std::this_thread::get_id() == m_worker.get_id();
    }

  private:
    void run();
    // Caller holds m_mutex.
    bool is_current(const TimerEntry &entry) const;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<TimerEntry> m_heap;
    std::map<std::string, uint64_t, std::less<>> m_active;
    uint64_t m_next_token{1};
    bool m_stop{false};
    std::thread m_worker;
};

bool EvictionSchedulerImpl::is_current(const TimerEntry &entry) const
{
    auto it = m_active.find(entry.key);
    return it != m_active.end() && it->second == entry.token;
}

bool EvictionSchedulerImpl::schedule(std::string_view key, std::chrono::milliseconds delay,
                                     EvictionScheduler::Callback callback)
{
    const auto deadline = EvictionScheduler::deadline_after(delay);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop)
        {
            return false;
        }
        const uint64_t token = m_next_token++;
        auto it = m_active.find(key);
        if (it != m_active.end())
        {
            it->second = token;
        }
        else
        {
            m_active.emplace(std::string(key), token);
        }
        m_heap.push_back(TimerEntry{deadline, token, std::string(key), std::move(callback)});
        std::push_heap(m_heap.begin(), m_heap.end(), FiresLater{});
    }
    m_cv.notify_one();
    return true;
}

bool EvictionSchedulerImpl::cancel(std::string_view key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(key);
    if (it == m_active.end())
    {
        return false;
    }
    m_active.erase(it);
    return true;
}

void EvictionSchedulerImpl::cancel_all()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_active.clear();
    // Every heap entry is stale now; drop them so captured state is released promptly.
    m_heap.clear();
}

bool EvictionSchedulerImpl::pending(std::string_view key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.find(key) != m_active.end();
}

std::size_t EvictionSchedulerImpl::pending_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.size();
}

void EvictionSchedulerImpl::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop && !m_worker.joinable())
        {
            return;
        }
        m_stop = true;
        m_active.clear();
        m_heap.clear();
    }
    m_cv.notify_all();
    // From inside a callback the loop exits by itself once the callback returns.
    if (m_worker.joinable() && !on_worker_thread())
    {
        m_worker.join();
    }
}

void EvictionSchedulerImpl::run()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stop)
    {
        while (!m_heap.empty() && !is_current(m_heap.front()))
        {
            std::pop_heap(m_heap.begin(), m_heap.end(), FiresLater{});
            m_heap.pop_back();
        }
        if (m_heap.empty())
        {
            m_cv.wait(lock, [this] { return m_stop || !m_heap.empty(); });
            continue;
        }

        const auto deadline = m_heap.front().deadline;
        if (EvictionScheduler::Clock::now() < deadline)
        {
            // Woken early by a new schedule/cancel/stop; re-examine the heap.
            if (deadline == EvictionScheduler::Clock::time_point::max())
            {
                m_cv.wait(lock);
            }
            else
            {
                m_cv.wait_until(lock, deadline);
            }
            continue;
        }

        std::pop_heap(m_heap.begin(), m_heap.end(), FiresLater{});
        TimerEntry entry = std::move(m_heap.back());
        m_heap.pop_back();
        m_active.erase(entry.key);

        lock.unlock();
        try
        {
            if (entry.callback)
            {
                entry.callback();
            }
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("EvictionScheduler: timer callback for '{}' threw: {}", entry.key,
                         e.what());
        }
        catch (...)
        {
            LOGGER_ERROR("EvictionScheduler: timer callback for '{}' threw a non-standard "
                         "exception",
                         entry.key);
        }
        // Release captured state before re-taking the lock.
        entry.callback = nullptr;
        lock.lock();
    }
}

// ---------------------------------------------------------------------------

EvictionScheduler::Clock::time_point
EvictionScheduler::deadline_after(std::chrono::milliseconds delay) noexcept
{
    const auto now = Clock::now();
    if (delay <= std::chrono::milliseconds::zero())
    {
        return now;
    }
    // Compare in milliseconds: converting a huge delay to the clock's ticks overflows.
    const auto headroom =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (delay >= headroom)
    {
        return Clock::time_point::max();
    }
    return now + std::chrono::duration_cast<Clock::duration>(delay);
}

EvictionScheduler::EvictionScheduler() : pImpl(std::make_unique<EvictionSchedulerImpl>()) {}

EvictionScheduler::~EvictionScheduler()
{
    if (pImpl->on_worker_thread())
    {
        RSD_PANIC("EvictionScheduler destroyed from inside one of its own callbacks.");
    }
    pImpl->stop();
}

bool EvictionScheduler::schedule(std::string_view key, std::chrono::milliseconds delay,
                                 Callback callback)
{
    return pImpl->schedule(key, delay, std::move(callback));
}

bool EvictionScheduler::cancel(std::string_view key)
{
    return pImpl->cancel(key);
}

void EvictionScheduler::cancel_all()
{
    pImpl->cancel_all();
}

bool EvictionScheduler::pending(std::string_view key) const
{
    return pImpl->pending(key);
}

std::size_t EvictionScheduler::pending_count() const
{
    return pImpl->pending_count();
}

void EvictionScheduler::stop()
{
    pImpl->stop();
}

} // namespace residency::utils
