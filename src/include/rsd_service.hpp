#pragma once
/**
 * @file rsd_service.hpp
 * @brief Layer 2: Service modules built on rsd_base.
 *
 * Provides the asynchronous logger, the eviction scheduler, the residency manager and
 * the JSON configuration loader.
 */
#include "rsd_base.hpp"

#include "utils/logger.hpp"
#include "utils/eviction_scheduler.hpp"
#include "utils/residency_manager.hpp"
#include "utils/residency_config.hpp"
