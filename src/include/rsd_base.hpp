#pragma once
/**
 * @file rsd_base.hpp
 * @brief Layer 1: Basic modules built on rsd_platform.
 *
 * Provides format_tools, debug_info, the RAII scope guard and the component definition
 * builder used to register components with a ResidencyManager.
 */
#include "rsd_platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/component_def.hpp"
