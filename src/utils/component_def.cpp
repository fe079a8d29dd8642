/*******************************************************************************
 * @file component_def.cpp
 * @brief ComponentDef builder: name validation and type-erased callback storage.
 ******************************************************************************/
#include "rsd_base.hpp"

#include "component_def_internals.hpp"

#include <stdexcept>

namespace
{
void validate_component_name(std::string_view name)
{
    if (name.empty())
    {
        throw std::invalid_argument("ComponentDef: component name must not be empty.");
    }
    if (name.size() > residency::utils::ComponentDef::MAX_COMPONENT_NAME_LEN)
    {
        throw std::length_error(
            fmt::format("ComponentDef: component name exceeds maximum of {} characters.",
                        residency::utils::ComponentDef::MAX_COMPONENT_NAME_LEN));
    }
}
} // namespace

namespace residency::utils
{

ComponentDef::ComponentDef(std::string_view name) : pImpl(std::make_unique<ComponentDefImpl>())
{
    validate_component_name(name);
    pImpl->name = std::string(name);
}

ComponentDef::~ComponentDef() = default;
ComponentDef::ComponentDef(ComponentDef &&other) noexcept = default;
ComponentDef &ComponentDef::operator=(ComponentDef &&other) noexcept = default;

void ComponentDef::set_erased_loader(std::type_index type, ErasedLoader loader)
{
    if (pImpl->unloader_type && *pImpl->unloader_type != type)
    {
        throw std::invalid_argument(fmt::format(
            "ComponentDef '{}': loader type does not match the unloader's instance type.",
            pImpl->name));
    }
    pImpl->loader = std::move(loader);
    pImpl->loader_type = type;
}

void ComponentDef::set_erased_unloader(std::type_index type, ErasedUnloader unloader,
                                       std::chrono::milliseconds timeout)
{
    if (pImpl->loader_type && *pImpl->loader_type != type)
    {
        throw std::invalid_argument(fmt::format(
            "ComponentDef '{}': unloader type does not match the loader's instance type.",
            pImpl->name));
    }
    if (timeout < std::chrono::milliseconds::zero())
    {
        throw std::invalid_argument(
            fmt::format("ComponentDef '{}': unload timeout must not be negative.", pImpl->name));
    }
    pImpl->unloader = std::move(unloader);
    pImpl->unloader_type = type;
    pImpl->unload_timeout = timeout;
}

void ComponentDef::set_estimated_memory_mb(double megabytes)
{
    if (!(megabytes >= 0.0))
    {
        throw std::invalid_argument(fmt::format(
            "ComponentDef '{}': estimated memory must be a non-negative number.", pImpl->name));
    }
    pImpl->estimated_memory_mb = megabytes;
}

void ComponentDef::set_idle_timeout(std::chrono::milliseconds timeout)
{
    if (timeout <= std::chrono::milliseconds::zero())
    {
        throw std::invalid_argument(
            fmt::format("ComponentDef '{}': idle timeout must be positive.", pImpl->name));
    }
    pImpl->idle_timeout = timeout;
}

std::string_view ComponentDef::name() const noexcept
{
    return pImpl ? std::string_view(pImpl->name) : std::string_view{};
}

bool ComponentDef::has_loader() const noexcept
{
    return pImpl && static_cast<bool>(pImpl->loader);
}

} // namespace residency::utils
