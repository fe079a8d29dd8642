#pragma once
// Private layout of ComponentDef, shared by component_def.cpp and residency_manager.cpp.
#include "utils/component_def.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <typeindex>

namespace residency::utils
{

class ComponentDefImpl
{
  public:
    std::string name;
    ComponentDef::ErasedLoader loader;
    ComponentDef::ErasedUnloader unloader;
    std::chrono::milliseconds unload_timeout{0};
    std::optional<std::type_index> loader_type;
    std::optional<std::type_index> unloader_type;
    double estimated_memory_mb{0.0};
    std::optional<std::chrono::milliseconds> idle_timeout;
};

} // namespace residency::utils
