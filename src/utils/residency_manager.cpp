/*******************************************************************************
 * @file residency_manager.cpp
 * @brief Implementation of the on-demand component residency manager.
 *
 * @see include/utils/residency_manager.hpp
 * @see include/utils/component_def.hpp
 *
 * **Implementation Details**
 *
 * 1.  **Slots**: every registered name maps to a `std::shared_ptr<ComponentSlot>`.
 *     The callbacks and metadata of a slot are immutable after registration; only the
 *     residency fields (state, instance, usage statistics) change, always under
 *     `m_mutex`. Re-registration installs a new slot object instead of mutating the
 *     old one, so a loader or timer holding the old slot can detect that it has been
 *     superseded by comparing pointers.
 *
 * 2.  **Claiming transitions**: a thread that wants to load or unload first moves the
 *     slot to `Loading`/`Unloading` under the lock, then runs the user callback with the
 *     lock released, then re-locks to publish the outcome and notifies `m_state_cv`.
 *     Any other `acquire()` observing a transitional state waits on `m_state_cv` with a
 *     deadline fixed at the start of its call.
 *
 * 3.  **Idle timers**: `EvictionScheduler` owns one pending timer per name. Timer
 *     callbacks capture a `weak_ptr` to the slot and re-check, under the lock, that the
 *     slot is still current, still `Loaded` and idle for the full timeout. Lock order
 *     is manager mutex, then scheduler mutex; the scheduler never holds its own mutex
 *     while running a callback.
 *
 * 4.  **Timed unloads**: an unloader registered with a timeout runs on a helper thread
 *     whose shared state owns everything it touches. If it overruns, the helper is
 *     detached and the slot is freed regardless.
 ******************************************************************************/
#include "rsd_service.hpp"

#include "component_def_internals.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace residency::utils
{

using Clock = std::chrono::steady_clock;

namespace
{

std::string describe_exception(const std::exception_ptr &ep)
{
    if (!ep)
    {
        return "no exception";
    }
    try
    {
        std::rethrow_exception(ep);
    }
    catch (const std::exception &e)
    {
        return e.what();
    }
    catch (...)
    {
        return "non-standard exception";
    }
}

double elapsed_ms(Clock::time_point since)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

} // namespace

// ---------------------------------------------------------------------------
// Free functions / ResidencyError
// ---------------------------------------------------------------------------

const char *to_string(ComponentState state) noexcept
{
    switch (state)
    {
    case ComponentState::NotLoaded:
        return "not_loaded";
    case ComponentState::Loading:
        return "loading";
    case ComponentState::Loaded:
        return "loaded";
    case ComponentState::Unloading:
        return "unloading";
    case ComponentState::Error:
        return "error";
    }
    return "unknown";
}

const char *to_string(ResidencyErrc code) noexcept
{
    switch (code)
    {
    case ResidencyErrc::UnknownComponent:
        return "UnknownComponent";
    case ResidencyErrc::LoadFailed:
        return "LoadFailed";
    case ResidencyErrc::LoadTimeout:
        return "LoadTimeout";
    case ResidencyErrc::TypeMismatch:
        return "TypeMismatch";
    }
    return "Unknown";
}

ResidencyError::ResidencyError(ResidencyErrc code, std::string component,
                               const std::string &message, std::exception_ptr cause)
    : std::runtime_error(fmt::format("{} [{}]: {}", to_string(code), component, message)),
      m_code(code), m_component(std::move(component)), m_cause(std::move(cause))
{
}

// ---------------------------------------------------------------------------
// Internal types
// ---------------------------------------------------------------------------

struct ComponentSlot
{
    // Immutable after registration.
    std::string name;
    ComponentDef::ErasedLoader loader;
    ComponentDef::ErasedUnloader unloader;
    std::chrono::milliseconds unload_timeout{0};
    std::type_index type{typeid(void)};
    double estimated_memory_mb{0.0};
    std::optional<std::chrono::milliseconds> idle_timeout;

    // Guarded by ResidencyManagerImpl::m_mutex.
    ComponentState state{ComponentState::NotLoaded};
    std::shared_ptr<void> instance;
    Clock::time_point last_used{};
    bool ever_used{false};
    std::uint64_t access_count{0};
};

using SlotPtr = std::shared_ptr<ComponentSlot>;

class ResidencyManagerImpl
{
  public:
    explicit ResidencyManagerImpl(ResidencyOptions options);

    void registerComponent(ComponentDefImpl &&def);
    std::shared_ptr<void> acquire(std::string_view name, std::type_index type, bool force_reload);
    void scheduleEviction(std::string_view name, std::optional<std::chrono::milliseconds> timeout);
    void evictComponent(std::string_view name);
    void evictAll();
    void shutdown() noexcept;

    StatusSnapshot status() const;
    ComponentState componentState(std::string_view name) const;
    bool isRegistered(std::string_view name) const;
    std::vector<std::string> componentNames() const;
    double residentMemoryMb() const;
    bool evictionPending(std::string_view name) const { return m_scheduler.pending(name); }

    void setLogSink(std::shared_ptr<ResidencyLogSink> sink);
    void clearLogSink() noexcept;
    const ResidencyOptions &options() const noexcept { return m_options; }

  private:
    // Caller holds m_mutex. Throws UnknownComponent.
    SlotPtr findSlotLocked(std::string_view name) const;
    // Caller holds m_mutex.
    bool isCurrentLocked(const SlotPtr &slot) const;
    // Caller holds m_mutex.
    double residentMemoryLocked() const;
    static void stampUseLocked(ComponentSlot &slot);

    /// Moves a Loaded slot through Unloading to NotLoaded. `lock` is held on entry and
    /// on return; it is released while the unloader runs.
    void evictLocked(std::unique_lock<std::mutex> &lock, const SlotPtr &slot,
                     std::string_view reason);

    /// Runs the slot's unloader (inline or with its timeout). Never throws.
    void runUnloader(const ComponentSlot &slot, std::shared_ptr<void> instance) noexcept;

    void onIdleTimer(const std::weak_ptr<ComponentSlot> &weak_slot,
                     std::chrono::milliseconds timeout);

    // Routes `msg` through the installed sink, or the global Logger when none is set.
    void residencyLog(ResidencyLogLevel level, const std::string &msg) const noexcept;

    template <typename... Args>
    void residencyDebug(fmt::format_string<Args...> fmt_str, Args &&...args) const
    {
        residencyLog(ResidencyLogLevel::Debug, fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void residencyInfo(fmt::format_string<Args...> fmt_str, Args &&...args) const
    {
        residencyLog(ResidencyLogLevel::Info, fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void residencyWarn(fmt::format_string<Args...> fmt_str, Args &&...args) const
    {
        residencyLog(ResidencyLogLevel::Warn, fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    template <typename... Args>
    void residencyError(fmt::format_string<Args...> fmt_str, Args &&...args) const
    {
        residencyLog(ResidencyLogLevel::Error, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    const ResidencyOptions m_options;
    mutable std::mutex m_mutex;             // Protects m_slots and every slot's residency fields
    std::condition_variable m_state_cv;     // Notified whenever a slot leaves Loading/Unloading
    std::map<std::string, SlotPtr, std::less<>> m_slots;
    std::atomic<std::shared_ptr<ResidencyLogSink>> m_log_sink{nullptr};
    std::atomic<bool> m_shut_down{false};
    // Declared last: its worker thread may call onIdleTimer() until it is stopped.
    EvictionScheduler m_scheduler;
};

namespace
{
void validate_options(const ResidencyOptions &options)
{
    if (options.default_idle_timeout <= std::chrono::milliseconds::zero())
    {
        throw std::invalid_argument("ResidencyOptions: default_idle_timeout must be positive.");
    }
    if (options.load_wait_timeout <= std::chrono::milliseconds::zero())
    {
        throw std::invalid_argument("ResidencyOptions: load_wait_timeout must be positive.");
    }
    if (!(options.memory_budget_mb >= 0.0))
    {
        throw std::invalid_argument("ResidencyOptions: memory_budget_mb must not be negative.");
    }
    for (const auto &[name, ov] : options.component_overrides)
    {
        if (ov.idle_timeout && *ov.idle_timeout <= std::chrono::milliseconds::zero())
        {
            throw std::invalid_argument(
                fmt::format("ResidencyOptions: idle timeout override for '{}' must be positive.",
                            name));
        }
        if (ov.estimated_memory_mb && !(*ov.estimated_memory_mb >= 0.0))
        {
            throw std::invalid_argument(fmt::format(
                "ResidencyOptions: memory override for '{}' must not be negative.", name));
        }
    }
}
} // namespace

ResidencyManagerImpl::ResidencyManagerImpl(ResidencyOptions options)
    : m_options((validate_options(options), std::move(options)))
{
}

// ============================================================================
// Lookup helpers
// ============================================================================

SlotPtr ResidencyManagerImpl::findSlotLocked(std::string_view name) const
{
    auto it = m_slots.find(name);
    if (it == m_slots.end())
    {
        throw ResidencyError(ResidencyErrc::UnknownComponent, std::string(name),
                             "no component registered under this name");
    }
    return it->second;
}

bool ResidencyManagerImpl::isCurrentLocked(const SlotPtr &slot) const
{
    auto it = m_slots.find(slot->name);
    return it != m_slots.end() && it->second == slot;
}

double ResidencyManagerImpl::residentMemoryLocked() const
{
    double total = 0.0;
    for (const auto &[name, slot] : m_slots)
    {
        if (slot->state == ComponentState::Loaded)
        {
            total += slot->estimated_memory_mb;
        }
    }
    return total;
}

void ResidencyManagerImpl::stampUseLocked(ComponentSlot &slot)
{
    slot.last_used = Clock::now();
    slot.ever_used = true;
    ++slot.access_count;
}

// ============================================================================
// Registration
// ============================================================================

void ResidencyManagerImpl::registerComponent(ComponentDefImpl &&def)
{
    auto slot = std::make_shared<ComponentSlot>();
    slot->name = std::move(def.name);
    slot->loader = std::move(def.loader);
    slot->unloader = std::move(def.unloader);
    slot->unload_timeout = def.unload_timeout;
    slot->type = *def.loader_type;
    slot->estimated_memory_mb = def.estimated_memory_mb;
    slot->idle_timeout = def.idle_timeout;

    if (auto ov = m_options.component_overrides.find(slot->name);
        ov != m_options.component_overrides.end())
    {
        if (ov->second.idle_timeout)
            slot->idle_timeout = ov->second.idle_timeout;
        if (ov->second.estimated_memory_mb)
            slot->estimated_memory_mb = *ov->second.estimated_memory_mb;
    }

    SlotPtr previous;
    std::shared_ptr<void> previous_instance;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_slots.find(slot->name);
        if (it != m_slots.end())
        {
            previous = it->second;
            if (previous->state == ComponentState::Loaded)
            {
                previous_instance = std::move(previous->instance);
                previous->state = ComponentState::NotLoaded;
            }
            it->second = slot;
        }
        else
        {
            m_slots.emplace(slot->name, slot);
        }
        m_scheduler.cancel(slot->name);
        // Waiters on the previous slot re-evaluate against the new one.
        m_state_cv.notify_all();
    }

    if (previous_instance)
    {
        residencyInfo("Component '{}' re-registered; releasing the previously loaded instance.",
                      slot->name);
        runUnloader(*previous, std::move(previous_instance));
        platform::release_free_memory();
    }
    residencyDebug("Registered component '{}' (~{:.0f} MB).", slot->name,
                   slot->estimated_memory_mb);
}

// ============================================================================
// Acquire
// ============================================================================

std::shared_ptr<void> ResidencyManagerImpl::acquire(std::string_view name, std::type_index type,
                                                    bool force_reload)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    SlotPtr slot = findSlotLocked(name);
    m_scheduler.cancel(name);

    const auto wait_deadline = EvictionScheduler::deadline_after(m_options.load_wait_timeout);
    for (;;)
    {
        if (slot->type != type)
        {
            throw ResidencyError(ResidencyErrc::TypeMismatch, slot->name,
                                 fmt::format("requested type '{}' but the loader produces '{}'",
                                             type.name(), slot->type.name()));
        }

        if (slot->state == ComponentState::Loading || slot->state == ComponentState::Unloading)
        {
            const auto settled_pred = [&]
            {
                return !isCurrentLocked(slot) || (slot->state != ComponentState::Loading &&
                                                  slot->state != ComponentState::Unloading);
            };
            bool settled = true;
            if (wait_deadline == Clock::time_point::max())
            {
                m_state_cv.wait(lock, settled_pred);
            }
            else
            {
                settled = m_state_cv.wait_until(lock, wait_deadline, settled_pred);
            }
            if (!settled)
            {
                residencyWarn("Timed out after {}ms waiting for component '{}' to finish {}.",
                              m_options.load_wait_timeout.count(), slot->name,
                              to_string(slot->state));
                throw ResidencyError(ResidencyErrc::LoadTimeout, slot->name,
                                     fmt::format("still {} after waiting {}ms",
                                                 to_string(slot->state),
                                                 m_options.load_wait_timeout.count()));
            }
            slot = findSlotLocked(name);
            continue;
        }

        if (slot->state == ComponentState::Loaded && !force_reload)
        {
            stampUseLocked(*slot);
            return slot->instance;
        }
        break; // NotLoaded, Error, or a forced reload of a Loaded slot.
    }

    // Claim the load. Everything until the outcome is published runs without the lock.
    std::shared_ptr<void> stale_instance = std::move(slot->instance);
    slot->state = ComponentState::Loading;
    auto claim_guard = basics::make_scope_guard(
        [&]
        {
            if (!lock.owns_lock())
                lock.lock();
            slot->instance.reset();
            slot->state = ComponentState::Error;
            m_state_cv.notify_all();
        });
    lock.unlock();

    if (stale_instance)
    {
        residencyInfo("Force-reloading component '{}'; releasing the current instance.",
                      slot->name);
        runUnloader(*slot, std::move(stale_instance));
        platform::release_free_memory();
    }

    residencyInfo("Loading component '{}' (~{:.0f} MB)...", slot->name, slot->estimated_memory_mb);
    const auto load_started = Clock::now();
    std::shared_ptr<void> fresh;
    std::exception_ptr failure;
    try
    {
        fresh = slot->loader();
    }
    catch (...)
    {
        failure = std::current_exception();
    }
    const double load_ms = elapsed_ms(load_started);

    lock.lock();
    if (failure || !fresh)
    {
        slot->state = ComponentState::Error;
        m_state_cv.notify_all();
        claim_guard.dismiss();
        lock.unlock();
        const std::string reason =
            failure ? describe_exception(failure) : std::string("loader returned no instance");
        residencyError("Failed to load component '{}' after {:.1f}ms: {}", slot->name, load_ms,
                       reason);
        throw ResidencyError(ResidencyErrc::LoadFailed, slot->name, reason, failure);
    }

    if (!isCurrentLocked(slot))
    {
        slot->state = ComponentState::NotLoaded;
        m_state_cv.notify_all();
        claim_guard.dismiss();
        lock.unlock();
        residencyWarn("Component '{}' was re-registered while loading; discarding the result.",
                      slot->name);
        runUnloader(*slot, std::move(fresh));
        throw ResidencyError(ResidencyErrc::LoadFailed, slot->name,
                             "component was re-registered while its load was in flight");
    }

    slot->instance = fresh;
    slot->state = ComponentState::Loaded;
    stampUseLocked(*slot);
    const double resident_mb = residentMemoryLocked();
    m_state_cv.notify_all();
    claim_guard.dismiss();
    lock.unlock();

    residencyInfo("Component '{}' loaded in {:.1f}ms.", slot->name, load_ms);
    if (m_options.memory_budget_mb > 0.0 && resident_mb > m_options.memory_budget_mb)
    {
        residencyWarn("Estimated resident memory {:.0f} MB exceeds the budget of {:.0f} MB.",
                      resident_mb, m_options.memory_budget_mb);
    }
    return fresh;
}

// ============================================================================
// Eviction
// ============================================================================

void ResidencyManagerImpl::runUnloader(const ComponentSlot &slot,
                                       std::shared_ptr<void> instance) noexcept
{
    if (!slot.unloader || !instance)
    {
        return;
    }

    if (slot.unload_timeout <= std::chrono::milliseconds::zero())
    {
        try
        {
            slot.unloader(instance.get());
        }
        catch (...)
        {
            residencyError("Unloader of component '{}' threw: {}", slot.name,
                           describe_exception(std::current_exception()));
        }
        return;
    }

    // Everything the helper thread touches lives in this shared block, so detaching it
    // on timeout leaves no dangling references to this stack frame.
    struct TimedUnload
    {
        std::mutex mutex;
        std::condition_variable cv;
        bool done{false};
        std::exception_ptr error;
    };
    auto shared = std::make_shared<TimedUnload>();
    try
    {
        std::thread worker(
            [shared, unloader = slot.unloader, instance]()
            {
                std::exception_ptr error;
                try
                {
                    unloader(instance.get());
                }
                catch (...)
                {
                    error = std::current_exception();
                }
                {
                    std::lock_guard<std::mutex> lk(shared->mutex);
                    shared->done = true;
                    shared->error = error;
                }
                shared->cv.notify_all();
            });

        std::unique_lock<std::mutex> lk(shared->mutex);
        if (!shared->cv.wait_for(lk, slot.unload_timeout, [&] { return shared->done; }))
        {
            lk.unlock();
            worker.detach();
            residencyError("Unloader of component '{}' did not finish within {}ms; abandoning it.",
                           slot.name, slot.unload_timeout.count());
            return;
        }
        const std::exception_ptr error = shared->error;
        lk.unlock();
        worker.join();
        if (error)
        {
            residencyError("Unloader of component '{}' threw: {}", slot.name,
                           describe_exception(error));
        }
    }
    catch (const std::exception &e)
    {
        // std::thread construction failed (std::system_error) or join failed.
        residencyError("Could not run the unloader of component '{}': {}", slot.name, e.what());
    }
}

void ResidencyManagerImpl::evictLocked(std::unique_lock<std::mutex> &lock, const SlotPtr &slot,
                                       std::string_view reason)
{
    std::shared_ptr<void> instance = std::move(slot->instance);
    slot->state = ComponentState::Unloading;
    lock.unlock();

    const auto started = Clock::now();
    runUnloader(*slot, std::move(instance));
    platform::release_free_memory();
    const double unload_ms = elapsed_ms(started);

    lock.lock();
    slot->state = ComponentState::NotLoaded;
    m_state_cv.notify_all();
    lock.unlock();
    residencyInfo("Component '{}' evicted ({}) in {:.1f}ms; ~{:.0f} MB released.", slot->name,
                  reason, unload_ms, slot->estimated_memory_mb);
    lock.lock();
}

void ResidencyManagerImpl::evictComponent(std::string_view name)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    SlotPtr slot = findSlotLocked(name);
    m_scheduler.cancel(name);
    if (slot->state != ComponentState::Loaded)
    {
        return;
    }
    evictLocked(lock, slot, "explicit");
}

void ResidencyManagerImpl::evictAll()
{
    std::vector<SlotPtr> loaded;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &[name, slot] : m_slots)
        {
            if (slot->state == ComponentState::Loaded)
            {
                loaded.push_back(slot);
            }
        }
    }

    for (const auto &slot : loaded)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        // Another thread may have evicted or reloaded it in between.
        if (slot->state == ComponentState::Loaded)
        {
            evictLocked(lock, slot, "evict all");
        }
    }
    m_scheduler.cancel_all();
}

void ResidencyManagerImpl::scheduleEviction(std::string_view name,
                                            std::optional<std::chrono::milliseconds> timeout)
{
    if (timeout && *timeout <= std::chrono::milliseconds::zero())
    {
        throw std::invalid_argument(
            fmt::format("schedule_eviction('{}'): idle timeout must be positive.", name));
    }
    if (m_shut_down.load(std::memory_order_acquire))
    {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    SlotPtr slot = findSlotLocked(name);
    const auto effective =
        timeout ? *timeout : slot->idle_timeout.value_or(m_options.default_idle_timeout);
    std::weak_ptr<ComponentSlot> weak_slot = slot;
    if (!m_scheduler.schedule(name, effective,
                              [this, weak_slot, effective] { onIdleTimer(weak_slot, effective); }))
    {
        residencyDebug("Idle eviction of '{}' not scheduled: scheduler is stopped.", slot->name);
        return;
    }
    residencyDebug("Idle eviction of '{}' scheduled in {}ms.", slot->name, effective.count());
}

void ResidencyManagerImpl::onIdleTimer(const std::weak_ptr<ComponentSlot> &weak_slot,
                                       std::chrono::milliseconds timeout)
{
    SlotPtr slot = weak_slot.lock();
    if (!slot)
    {
        return;
    }
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!isCurrentLocked(slot) || slot->state != ComponentState::Loaded)
    {
        return;
    }
    const auto idle = Clock::now() - slot->last_used;
    if (std::chrono::duration_cast<std::chrono::milliseconds>(idle) < timeout)
    {
        residencyDebug("Component '{}' was used {:.1f}s ago; keeping it resident.", slot->name,
                       std::chrono::duration<double>(idle).count());
        return;
    }
    evictLocked(lock, slot, "idle timeout");
}

void ResidencyManagerImpl::shutdown() noexcept
{
    if (m_shut_down.exchange(true))
    {
        return;
    }
    // Stop first: once stop() returns no timer callback is running or will run.
    m_scheduler.stop();
    try
    {
        evictAll();
    }
    catch (const std::exception &e)
    {
        residencyError("ResidencyManager shutdown: eviction failed: {}", e.what());
    }
}

// ============================================================================
// Queries
// ============================================================================

StatusSnapshot ResidencyManagerImpl::status() const
{
    StatusSnapshot snapshot;
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = Clock::now();
    for (const auto &[name, slot] : m_slots)
    {
        ComponentStatus st;
        st.state = slot->state;
        st.idle_seconds =
            slot->ever_used ? std::chrono::duration<double>(now - slot->last_used).count() : 0.0;
        st.access_count = slot->access_count;
        st.estimated_memory_mb = slot->estimated_memory_mb;
        snapshot.emplace(name, st);
    }
    return snapshot;
}

ComponentState ResidencyManagerImpl::componentState(std::string_view name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return findSlotLocked(name)->state;
}

bool ResidencyManagerImpl::isRegistered(std::string_view name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.find(name) != m_slots.end();
}

std::vector<std::string> ResidencyManagerImpl::componentNames() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_slots.size());
    for (const auto &[name, slot] : m_slots)
    {
        names.push_back(name);
    }
    return names;
}

double ResidencyManagerImpl::residentMemoryMb() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return residentMemoryLocked();
}

// ============================================================================
// Log sink
// ============================================================================

void ResidencyManagerImpl::setLogSink(std::shared_ptr<ResidencyLogSink> sink)
{
    m_log_sink.store(std::move(sink), std::memory_order_release);
}

void ResidencyManagerImpl::clearLogSink() noexcept
{
    m_log_sink.store(nullptr, std::memory_order_release);
}

void ResidencyManagerImpl::residencyLog(ResidencyLogLevel level,
                                        const std::string &msg) const noexcept
{
    auto sink_ptr = m_log_sink.load(std::memory_order_acquire);
    if (sink_ptr && *sink_ptr)
    {
        try
        {
            (*sink_ptr)(level, msg);
            return;
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("ResidencyManager log sink threw: {}", e.what());
        }
    }
    switch (level)
    {
    case ResidencyLogLevel::Debug:
        LOGGER_DEBUG("[residency] {}", msg);
        break;
    case ResidencyLogLevel::Info:
        LOGGER_INFO("[residency] {}", msg);
        break;
    case ResidencyLogLevel::Warn:
        LOGGER_WARN("[residency] {}", msg);
        break;
    case ResidencyLogLevel::Error:
        LOGGER_ERROR("[residency] {}", msg);
        break;
    }
}

// ============================================================================
// ResidencyManager public API (Pimpl forwarding)
// ============================================================================

ResidencyManager::ResidencyManager(ResidencyOptions options)
    : pImpl(std::make_unique<ResidencyManagerImpl>(std::move(options)))
{
}

ResidencyManager::~ResidencyManager()
{
    if (pImpl)
    {
        pImpl->shutdown();
    }
}

void ResidencyManager::register_component(ComponentDef &&def)
{
    if (!def.pImpl || !def.pImpl->loader || !def.pImpl->loader_type)
    {
        throw std::invalid_argument(fmt::format(
            "ResidencyManager: component '{}' cannot be registered without a loader.",
            def.name()));
    }
    pImpl->registerComponent(std::move(*def.pImpl));
}

std::shared_ptr<void> ResidencyManager::acquire_erased(std::string_view name,
                                                       std::type_index type, bool force_reload)
{
    return pImpl->acquire(name, type, force_reload);
}

void ResidencyManager::schedule_eviction(std::string_view name,
                                         std::chrono::milliseconds idle_timeout)
{
    pImpl->scheduleEviction(name, idle_timeout);
}

void ResidencyManager::schedule_eviction(std::string_view name)
{
    pImpl->scheduleEviction(name, std::nullopt);
}

void ResidencyManager::evict_component(std::string_view name)
{
    pImpl->evictComponent(name);
}

void ResidencyManager::evict_all()
{
    pImpl->evictAll();
}

StatusSnapshot ResidencyManager::status() const
{
    return pImpl->status();
}

ComponentState ResidencyManager::component_state(std::string_view name) const
{
    return pImpl->componentState(name);
}

bool ResidencyManager::is_registered(std::string_view name) const
{
    return pImpl->isRegistered(name);
}

std::vector<std::string> ResidencyManager::component_names() const
{
    return pImpl->componentNames();
}

double ResidencyManager::resident_memory_mb() const
{
    return pImpl->residentMemoryMb();
}

bool ResidencyManager::eviction_pending(std::string_view name) const
{
    return pImpl->evictionPending(name);
}

void ResidencyManager::set_log_sink(ResidencyLogSink sink)
{
    if (sink)
    {
        pImpl->setLogSink(std::make_shared<ResidencyLogSink>(std::move(sink)));
    }
    else
    {
        pImpl->clearLogSink();
    }
}

void ResidencyManager::clear_log_sink() noexcept
{
    pImpl->clearLogSink();
}

const ResidencyOptions &ResidencyManager::options() const noexcept
{
    return pImpl->options();
}

} // namespace residency::utils
