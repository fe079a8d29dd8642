#pragma once
/*******************************************************************************
 * @file residency_manager.hpp
 * @brief On-demand loading, sharing and idle eviction of expensive components.
 *
 * **Overview**
 * A `ResidencyManager` is a registry of named components (a language model, a speech
 * recognizer, an automation driver, ...) that are too heavy to keep resident all the
 * time. Each component is registered with a loader; the first `acquire()` runs the
 * loader, later calls return the same instance, and an idle timer armed with
 * `schedule_eviction()` releases the instance once nobody has used it for a while.
 *
 * **States**
 * `NotLoaded -> Loading -> Loaded -> Unloading -> NotLoaded`, plus `Loading -> Error`
 * when the loader fails. `Error` is not sticky: the next `acquire()` retries.
 *
 * **Concurrency**
 * - All operations are thread-safe.
 * - At most one load per component is in flight. Concurrent `acquire()` calls for a
 *   component that is loading wait on a condition variable, bounded by the configured
 *   load-wait ceiling, and then all observe the same instance.
 * - Loaders and unloaders run without the manager lock, so a slow load of one
 *   component never blocks operations on another.
 * - Idle checks run on a single background scheduler thread; they never fire after
 *   the manager has been destroyed.
 *
 * **Ownership**
 * `acquire<T>()` returns a `std::shared_ptr<T>`. Callers hold it for the duration of one
 * operation. Eviction runs the unloader and drops the manager's reference; memory is
 * reclaimed once the last in-flight caller releases its pointer.
 *
 * **Example**
 * ```cpp
 * ResidencyManager manager(options);
 * manager.register_component<ChatModel>("chat_model",
 *     [] { return std::make_shared<ChatModel>("model.gguf"); },
 *     [](ChatModel &m) { m.close(); }, 1600.0);
 *
 * auto model = manager.acquire<ChatModel>("chat_model");
 * auto reply = model->generate(prompt);
 * manager.schedule_eviction("chat_model", std::chrono::seconds(60));
 * ```
 ******************************************************************************/
#include "residency_utils_export.h"
#include "utils/component_def.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace residency::utils
{

/// Residency state of one component.
enum class ComponentState : int
{
    NotLoaded = 0,
    Loading,
    Loaded,
    Unloading,
    Error
};

RESIDENCY_UTILS_EXPORT const char *to_string(ComponentState state) noexcept;

enum class ResidencyErrc : int
{
    UnknownComponent, ///< The name was never registered.
    LoadFailed,       ///< The loader threw or produced no instance.
    LoadTimeout,      ///< Waiting for another caller's load exceeded the ceiling.
    TypeMismatch,     ///< acquire<T> with a T other than the loader's type.
};

RESIDENCY_UTILS_EXPORT const char *to_string(ResidencyErrc code) noexcept;

/**
 * @brief Error raised by ResidencyManager operations.
 * @details `cause()` carries the loader's original exception for `LoadFailed`.
 */
class RESIDENCY_UTILS_EXPORT ResidencyError : public std::runtime_error
{
  public:
    ResidencyError(ResidencyErrc code, std::string component, const std::string &message,
                   std::exception_ptr cause = nullptr);

    [[nodiscard]] ResidencyErrc code() const noexcept { return m_code; }
    [[nodiscard]] const std::string &component() const noexcept { return m_component; }
    [[nodiscard]] std::exception_ptr cause() const noexcept { return m_cause; }

  private:
    ResidencyErrc m_code;
    std::string m_component;
    std::exception_ptr m_cause;
};

/// Point-in-time view of one component, as returned by `status()`.
struct ComponentStatus
{
    ComponentState state{ComponentState::NotLoaded};
    double idle_seconds{0.0}; ///< Seconds since the last successful acquire; 0 if never used.
    std::uint64_t access_count{0};
    double estimated_memory_mb{0.0};
};

using StatusSnapshot = std::map<std::string, ComponentStatus, std::less<>>;

/// Severity of manager events delivered to a ResidencyLogSink.
enum class ResidencyLogLevel : int
{
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
};

/**
 * @brief Receives the manager's event messages instead of the global Logger.
 * @details Called from whichever thread produced the event (callers of acquire/evict,
 *          or the scheduler thread). Must not call back into the manager.
 */
using ResidencyLogSink = std::function<void(ResidencyLogLevel, const std::string &)>;

/// Configured values that take precedence over those given in a ComponentDef.
struct ComponentOverrides
{
    std::optional<std::chrono::milliseconds> idle_timeout;
    std::optional<double> estimated_memory_mb;
};

struct ResidencyOptions
{
    /// Used by `schedule_eviction(name)` when the component has no idle timeout of its own.
    std::chrono::milliseconds default_idle_timeout{std::chrono::seconds(60)};
    /// Ceiling on how long acquire() waits for a load started by another caller.
    std::chrono::milliseconds load_wait_timeout{std::chrono::seconds(30)};
    /// Advisory: a warning is logged when loaded estimates exceed it. 0 disables.
    double memory_budget_mb{0.0};
    std::map<std::string, ComponentOverrides, std::less<>> component_overrides;
};

class ResidencyManagerImpl;

class RESIDENCY_UTILS_EXPORT ResidencyManager
{
  public:
    explicit ResidencyManager(ResidencyOptions options = {});

    /// Stops the idle timers (none fires afterwards), then evicts every loaded component.
    ~ResidencyManager();

    ResidencyManager(const ResidencyManager &) = delete;
    ResidencyManager &operator=(const ResidencyManager &) = delete;
    ResidencyManager(ResidencyManager &&) = delete;
    ResidencyManager &operator=(ResidencyManager &&) = delete;

    /**
     * @brief Installs (or replaces) a component definition.
     *
     * Last write wins: a previous definition under the same name is discarded, its
     * pending idle timer cancelled and its loaded instance, if any, released through the
     * previous unloader. The new definition starts `NotLoaded` with zeroed counters.
     * A load of the previous definition that is still in flight reports `LoadFailed`.
     *
     * @throws std::invalid_argument if the definition has no loader.
     */
    void register_component(ComponentDef &&def);

    /// Convenience overload building the ComponentDef in place.
    template <typename T>
    void register_component(std::string_view name, std::function<std::shared_ptr<T>()> loader,
                            std::function<void(T &)> unloader = {},
                            double estimated_memory_mb = 0.0)
    {
        ComponentDef def(name);
        def.set_loader<T>(std::move(loader));
        if (unloader)
        {
            def.set_unloader<T>(std::move(unloader));
        }
        def.set_estimated_memory_mb(estimated_memory_mb);
        register_component(std::move(def));
    }

    /**
     * @brief Returns the component's instance, loading it first if necessary.
     *
     * Cancels any pending idle timer for the component. With `force_reload`, a loaded
     * instance is released through the unloader and the loader runs again.
     *
     * @throws ResidencyError with UnknownComponent, TypeMismatch, LoadFailed or
     *         LoadTimeout.
     */
    template <typename T>
    std::shared_ptr<T> acquire(std::string_view name, bool force_reload = false)
    {
        return std::static_pointer_cast<T>(
            acquire_erased(name, std::type_index(typeid(T)), force_reload));
    }

    /**
     * @brief Arms (or re-arms) the idle timer of a component.
     *
     * When the timer fires the component is evicted only if it is still `Loaded` and has
     * not been acquired during the last `idle_timeout`. Never blocks on the eviction.
     *
     * @throws ResidencyError(UnknownComponent)
     * @throws std::invalid_argument if `idle_timeout` is not positive.
     */
    void schedule_eviction(std::string_view name, std::chrono::milliseconds idle_timeout);

    /// Same, with the component's configured idle timeout or the manager default.
    void schedule_eviction(std::string_view name);

    /**
     * @brief Releases a loaded component now. No-op unless the component is `Loaded`.
     * @details Unloader exceptions and timeouts are logged; the component always ends up
     *          `NotLoaded`.
     * @throws ResidencyError(UnknownComponent)
     */
    void evict_component(std::string_view name);

    /// Evicts every loaded component and cancels all idle timers. Idempotent.
    void evict_all();

    /// Snapshot of every registered component. Never waits for a load to finish.
    [[nodiscard]] StatusSnapshot status() const;

    /// @throws ResidencyError(UnknownComponent)
    [[nodiscard]] ComponentState component_state(std::string_view name) const;

    [[nodiscard]] bool is_registered(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> component_names() const;

    /// Sum of the estimated memory of all `Loaded` components.
    [[nodiscard]] double resident_memory_mb() const;

    [[nodiscard]] bool eviction_pending(std::string_view name) const;

    /// Routes manager events to `sink` instead of the global Logger.
    void set_log_sink(ResidencyLogSink sink);
    void clear_log_sink() noexcept;

    [[nodiscard]] const ResidencyOptions &options() const noexcept;

  private:
    std::shared_ptr<void> acquire_erased(std::string_view name, std::type_index type,
                                         bool force_reload);

    std::unique_ptr<ResidencyManagerImpl> pImpl;
};

} // namespace residency::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
