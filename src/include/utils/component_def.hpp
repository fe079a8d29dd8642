#pragma once
/**
 * @file component_def.hpp
 * @brief Builder describing one lazily loaded component for ResidencyManager registration.
 */
#include "residency_utils_export.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <typeindex>
#include <typeinfo>

// Disable warning C4251 on MSVC for the Pimpl unique_ptr member.
#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace residency::utils
{

class ComponentDefImpl;
class ResidencyManager;

/**
 * @class ComponentDef
 * @brief Move-only builder for a component definition.
 *
 * A definition carries the component's name, the loader that constructs its instance,
 * an optional unloader run on eviction, the advisory memory estimate used in status
 * reports and an optional per-component idle timeout. The loader's instance type is
 * recorded so that `ResidencyManager::acquire<T>` can reject a mismatched `T`.
 *
 * Ownership moves into the manager on `ResidencyManager::register_component`.
 *
 * ```cpp
 * ComponentDef def("chat_model");
 * def.set_loader<ChatModel>([] { return std::make_shared<ChatModel>("llama.gguf"); });
 * def.set_unloader<ChatModel>([](ChatModel &m) { m.close(); });
 * def.set_estimated_memory_mb(1600);
 * manager.register_component(std::move(def));
 * ```
 */
class RESIDENCY_UTILS_EXPORT ComponentDef
{
  public:
    /// Maximum number of characters allowed in a component name.
    static constexpr size_t MAX_COMPONENT_NAME_LEN = 256;

    using ErasedLoader = std::function<std::shared_ptr<void>()>;
    using ErasedUnloader = std::function<void(void *)>;

    /**
     * @param name Unique component name. Must be non-empty and at most
     *             `MAX_COMPONENT_NAME_LEN` characters.
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_COMPONENT_NAME_LEN`.
     */
    explicit ComponentDef(std::string_view name);
    ~ComponentDef();

    ComponentDef(ComponentDef &&other) noexcept;
    ComponentDef &operator=(ComponentDef &&other) noexcept;
    ComponentDef(const ComponentDef &) = delete;
    ComponentDef &operator=(const ComponentDef &) = delete;

    /**
     * @brief Sets the zero-argument factory that builds the instance.
     *
     * The loader may throw; an empty result is treated as a failed load.
     * @throws std::invalid_argument if `loader` is empty, or if an unloader for a
     *         different type was already set.
     */
    template <typename T> void set_loader(std::function<std::shared_ptr<T>()> loader)
    {
        if (!loader)
        {
            throw std::invalid_argument("ComponentDef: loader must not be empty.");
        }
        set_erased_loader(std::type_index(typeid(T)),
                          [fn = std::move(loader)]() -> std::shared_ptr<void> { return fn(); });
    }

    /**
     * @brief Sets the callback releasing an instance on eviction.
     *
     * @param unloader Receives the instance just before the manager drops its reference.
     * @param timeout  If non-zero, the unloader runs on a helper thread and is abandoned
     *                 (detached) when it does not finish in time. Zero runs it inline.
     * @throws std::invalid_argument if `unloader` is empty or `T` differs from the
     *         loader's type.
     */
    template <typename T>
    void set_unloader(std::function<void(T &)> unloader,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds::zero())
    {
        if (!unloader)
        {
            throw std::invalid_argument("ComponentDef: unloader must not be empty.");
        }
        set_erased_unloader(std::type_index(typeid(T)),
                            [fn = std::move(unloader)](void *instance)
                            { fn(*static_cast<T *>(instance)); },
                            timeout);
    }

    /**
     * @brief Advisory memory cost reported by `ResidencyManager::status()`.
     * @throws std::invalid_argument if `megabytes` is negative.
     */
    void set_estimated_memory_mb(double megabytes);

    /**
     * @brief Idle timeout used by `ResidencyManager::schedule_eviction(name)`.
     * @throws std::invalid_argument if `timeout` is not positive.
     */
    void set_idle_timeout(std::chrono::milliseconds timeout);

    [[nodiscard]] std::string_view name() const noexcept;
    [[nodiscard]] bool has_loader() const noexcept;

  private:
    void set_erased_loader(std::type_index type, ErasedLoader loader);
    void set_erased_unloader(std::type_index type, ErasedUnloader unloader,
                             std::chrono::milliseconds timeout);

    friend class ResidencyManager;
    std::unique_ptr<ComponentDefImpl> pImpl;
};

} // namespace residency::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
