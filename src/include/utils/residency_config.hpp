#pragma once
/**
 * @file residency_config.hpp
 * @brief Layered JSON configuration for the residency manager and its logger.
 *
 * Resolution order (later layers win):
 *   1. built-in defaults (`default_config_json()`),
 *   2. the JSON file passed to `load_residency_config()`, or the file named by
 *      `RESIDENCY_CONFIG_FILE` when no path is passed,
 *   3. environment overrides:
 *        RESIDENCY_DEFAULT_IDLE_TIMEOUT_S, RESIDENCY_LOAD_WAIT_TIMEOUT_S,
 *        RESIDENCY_LOG_LEVEL, RESIDENCY_LOG_FILE.
 *
 * File format:
 * ```json
 * {
 *   "residency":  { "default_idle_timeout_s": 60, "load_wait_timeout_s": 30,
 *                   "memory_budget_mb": 4096 },
 *   "logging":    { "level": "info", "file": "", "use_flock": false },
 *   "components": { "chat_model": { "idle_timeout_s": 60, "estimated_memory_mb": 1600 } }
 * }
 * ```
 *
 * Every error (unreadable file, malformed JSON, wrong type, out-of-range value) is
 * reported as `std::runtime_error` naming the offending key.
 */
#include "residency_utils_export.h"
#include "utils/logger.hpp"
#include "utils/residency_manager.hpp"

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace residency::utils
{

struct LoggingConfig
{
    Logger::Level level{Logger::Level::L_INFO};
    std::string file; ///< Empty means console (stderr).
    bool use_flock{false};
};

struct ResidencyConfig
{
    ResidencyOptions residency;
    LoggingConfig logging;
    std::filesystem::path source; ///< File the configuration was read from; empty for defaults.
};

/// The built-in defaults as a JSON document.
RESIDENCY_UTILS_EXPORT nlohmann::json default_config_json();

/// Recursively merges `overrides` into `base`; objects merge key by key, anything else
/// replaces the value in `base`.
RESIDENCY_UTILS_EXPORT void json_merge(nlohmann::json &base, const nlohmann::json &overrides);

/// Validates a complete (already merged) document and converts it.
/// @throws std::runtime_error on any invalid value.
RESIDENCY_UTILS_EXPORT ResidencyConfig parse_residency_config(const nlohmann::json &j);

/// Writes the RESIDENCY_* environment overrides into `merged`.
/// @throws std::runtime_error if a numeric variable does not parse.
RESIDENCY_UTILS_EXPORT void apply_env_overrides(nlohmann::json &merged);

/**
 * @brief Resolves defaults, file and environment into a ResidencyConfig.
 * @param path Explicit config file. When absent, `RESIDENCY_CONFIG_FILE` is consulted;
 *             when neither is set, only defaults and environment apply.
 * @throws std::runtime_error if the file cannot be read or any value is invalid.
 */
RESIDENCY_UTILS_EXPORT ResidencyConfig
load_residency_config(const std::optional<std::filesystem::path> &path = std::nullopt);

} // namespace residency::utils
