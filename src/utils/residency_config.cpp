/**
 * @file residency_config.cpp
 * @brief Layered JSON configuration: defaults, file, environment.
 */
#include "rsd_service.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace residency::utils
{

namespace
{

[[noreturn]] void config_error(const std::string &what)
{
    throw std::runtime_error("residency config: " + what);
}

nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        config_error(fmt::format("cannot open '{}'", path.string()));
    }
    try
    {
        nlohmann::json j;
        f >> j;
        if (!j.is_object())
        {
            config_error(fmt::format("'{}' must contain a JSON object", path.string()));
        }
        return j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        config_error(fmt::format("'{}' is not valid JSON: {}", path.string(), e.what()));
    }
}

const nlohmann::json &section(const nlohmann::json &root, const char *name)
{
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!root.contains(name))
    {
        return kEmpty;
    }
    const auto &s = root.at(name);
    if (!s.is_object())
    {
        config_error(fmt::format("'{}' must be an object", name));
    }
    return s;
}

std::optional<double> get_number(const nlohmann::json &obj, const std::string &path,
                                 const char *key)
{
    if (!obj.contains(key) || obj.at(key).is_null())
    {
        return std::nullopt;
    }
    const auto &v = obj.at(key);
    if (!v.is_number())
    {
        config_error(fmt::format("'{}.{}' must be a number", path, key));
    }
    const double d = v.get<double>();
    if (!std::isfinite(d))
    {
        config_error(fmt::format("'{}.{}' must be finite", path, key));
    }
    return d;
}

std::chrono::milliseconds positive_seconds(double seconds, const std::string &path,
                                           const char *key)
{
    if (seconds <= 0.0)
    {
        config_error(fmt::format("'{}.{}' must be greater than 0 (got {})", path, key, seconds));
    }
    // Beyond this the millisecond count no longer fits in 64 bits.
    constexpr double kMaxSeconds = 9.0e15;
    if (seconds > kMaxSeconds)
    {
        config_error(fmt::format("'{}.{}' must not exceed {} seconds (got {})", path, key,
                                 kMaxSeconds, seconds));
    }
    const auto ms = std::chrono::milliseconds(std::llround(seconds * 1000.0));
    return ms.count() > 0 ? ms : std::chrono::milliseconds(1);
}

double non_negative(double value, const std::string &path, const char *key)
{
    if (value < 0.0)
    {
        config_error(fmt::format("'{}.{}' must not be negative (got {})", path, key, value));
    }
    return value;
}

double env_number(const char *var, const char *value)
{
    errno = 0;
    char *end = nullptr;
    const double d = std::strtod(value, &end);
    if (end == value || *end != '\0' || errno == ERANGE || !std::isfinite(d))
    {
        config_error(fmt::format("environment variable {}='{}' is not a number", var, value));
    }
    return d;
}

} // namespace

nlohmann::json default_config_json()
{
    return nlohmann::json{
        {"residency",
         {{"default_idle_timeout_s", 60}, {"load_wait_timeout_s", 30}, {"memory_budget_mb", 0}}},
        {"logging", {{"level", "info"}, {"file", ""}, {"use_flock", false}}},
        {"components", nlohmann::json::object()},
    };
}

void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

void apply_env_overrides(nlohmann::json &merged)
{
    if (const char *env = std::getenv("RESIDENCY_DEFAULT_IDLE_TIMEOUT_S"))
        merged["residency"]["default_idle_timeout_s"] =
            env_number("RESIDENCY_DEFAULT_IDLE_TIMEOUT_S", env);
    if (const char *env = std::getenv("RESIDENCY_LOAD_WAIT_TIMEOUT_S"))
        merged["residency"]["load_wait_timeout_s"] =
            env_number("RESIDENCY_LOAD_WAIT_TIMEOUT_S", env);
    if (const char *env = std::getenv("RESIDENCY_LOG_LEVEL"))
        merged["logging"]["level"] = env;
    if (const char *env = std::getenv("RESIDENCY_LOG_FILE"))
        merged["logging"]["file"] = env;
}

ResidencyConfig parse_residency_config(const nlohmann::json &j)
{
    if (!j.is_object())
    {
        config_error("document root must be an object");
    }

    ResidencyConfig cfg;

    // ── residency ────────────────────────────────────────────────────────────
    const auto &res = section(j, "residency");
    if (auto v = get_number(res, "residency", "default_idle_timeout_s"))
        cfg.residency.default_idle_timeout =
            positive_seconds(*v, "residency", "default_idle_timeout_s");
    if (auto v = get_number(res, "residency", "load_wait_timeout_s"))
        cfg.residency.load_wait_timeout = positive_seconds(*v, "residency", "load_wait_timeout_s");
    if (auto v = get_number(res, "residency", "memory_budget_mb"))
        cfg.residency.memory_budget_mb = non_negative(*v, "residency", "memory_budget_mb");

    // ── logging ──────────────────────────────────────────────────────────────
    const auto &log = section(j, "logging");
    if (log.contains("level"))
    {
        if (!log.at("level").is_string())
            config_error("'logging.level' must be a string");
        try
        {
            cfg.logging.level = parse_log_level(log.at("level").get<std::string>());
        }
        catch (const std::invalid_argument &e)
        {
            config_error(fmt::format("'logging.level': {}", e.what()));
        }
    }
    if (log.contains("file"))
    {
        if (!log.at("file").is_string())
            config_error("'logging.file' must be a string");
        cfg.logging.file = log.at("file").get<std::string>();
    }
    if (log.contains("use_flock"))
    {
        if (!log.at("use_flock").is_boolean())
            config_error("'logging.use_flock' must be a boolean");
        cfg.logging.use_flock = log.at("use_flock").get<bool>();
    }

    // ── components ───────────────────────────────────────────────────────────
    const auto &components = section(j, "components");
    for (auto it = components.begin(); it != components.end(); ++it)
    {
        const std::string path = "components." + it.key();
        if (!it.value().is_object())
        {
            config_error(fmt::format("'{}' must be an object", path));
        }
        ComponentOverrides ov;
        if (auto v = get_number(it.value(), path, "idle_timeout_s"))
            ov.idle_timeout = positive_seconds(*v, path, "idle_timeout_s");
        if (auto v = get_number(it.value(), path, "estimated_memory_mb"))
            ov.estimated_memory_mb = non_negative(*v, path, "estimated_memory_mb");
        cfg.residency.component_overrides.emplace(it.key(), ov);
    }

    return cfg;
}

ResidencyConfig load_residency_config(const std::optional<fs::path> &path)
{
    nlohmann::json merged = default_config_json();

    fs::path source;
    if (path)
    {
        source = *path;
    }
    else if (const char *env = std::getenv("RESIDENCY_CONFIG_FILE"); env && *env)
    {
        source = env;
    }

    if (!source.empty())
    {
        json_merge(merged, read_json_file(source));
    }
    apply_env_overrides(merged);

    ResidencyConfig cfg = parse_residency_config(merged);
    cfg.source = source;
    return cfg;
}

} // namespace residency::utils
