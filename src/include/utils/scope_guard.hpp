#pragma once
/**
 * @file scope_guard.hpp
 * @brief A generic RAII scope guard running a callable on scope exit.
 *
 * ```cpp
 * auto guard = residency::basics::make_scope_guard([&] { slot.state = State::NotLoaded; });
 * do_risky_work();
 * guard.dismiss(); // commit
 * ```
 *
 * The guard is move-only. Exceptions thrown by the callable from the destructor or from
 * `invoke()` are reported through RSD_DEBUG and do not escape; use
 * `invoke_and_rethrow()` when the caller must observe them.
 */
#include <concepts>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include "utils/debug_info.hpp"

namespace residency::basics
{

// Constrained on `Callable &` because the guard stores the callable and invokes it as
// an lvalue; rvalue-only callables are rejected at make_scope_guard.
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept { invoke(); }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    constexpr void dismiss() noexcept { m_active = false; }

    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // Must dismiss before invoke to prevent double execution.
            try
            {
                std::invoke(m_func);
            }
            catch (const std::exception &e)
            {
                RSD_DEBUG("ScopeGuard callable threw: {}", e.what());
            }
        }
    }

    void invoke_and_rethrow()
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace residency::basics
