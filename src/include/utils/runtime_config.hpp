#pragma once

/**
 * @file runtime_config.hpp
 * @brief Runtime configuration: built-in defaults, an optional JSON file, env overrides.
 *
 * Loading strategy (priority low to high):
 *  1. Built-in defaults (the values documented on each accessor)
 *  2. The JSON file passed to set_config_path(), else the file named by CONDUIT_CONFIG_FILE
 *  3. CONDUIT_MODULE_ROOT / CONDUIT_LOG_LEVEL environment overrides
 *
 * The process-wide instance is loaded once by the service lifecycle and is read-only
 * afterwards. Tests and embedders may also build instances directly with from_json().
 *
 * Example file:
 * @code{.json}
 * {
 *   "runtime":    { "name": "edge-gateway" },
 *   "components": { "module_root": "/opt/gateway/components" },
 *   "lifecycle":  { "detach_timeout_ms": 2000, "drain_timeout_ms": 3000,
 *                 "cycle_policy": "fail_dependents" },
 *   "pipeline":   { "default_timeout_ms": 250 },
 *   "logger":     { "level": "debug" }
 * }
 * @endcode
 */

#include "utils/module_def.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::utils
{

class CONDUIT_RUNTIME_EXPORT RuntimeConfig
{
  public:
    RuntimeConfig();
    ~RuntimeConfig();
    RuntimeConfig(const RuntimeConfig &other);
    RuntimeConfig &operator=(const RuntimeConfig &other);
    RuntimeConfig(RuntimeConfig &&) noexcept;
    RuntimeConfig &operator=(RuntimeConfig &&) noexcept;

    /**
     * @brief Builds a configuration from defaults overlaid with @p j.
     * @throws std::invalid_argument if a known key has the wrong type or an unknown
     *         enumeration value.
     */
    static RuntimeConfig from_json(const nlohmann::json &j);

    /**
     * @brief Reads @p path and overlays it on the defaults.
     * @throws std::runtime_error if the file cannot be opened or parsed.
     */
    static RuntimeConfig from_file(const std::filesystem::path &path);

    // -----------------------------------------------------------------------
    // Process-wide instance
    // -----------------------------------------------------------------------

    /// Call before the LifecycleGuard to pin the configuration file.
    static void set_config_path(const std::filesystem::path &path);

    /// Service definition. Depends on the Logger.
    static ModuleDef GetLifecycleModule();

    /// The process-wide instance. Holds defaults until the service has started.
    static const RuntimeConfig &get_instance();

    // -----------------------------------------------------------------------
    // Values
    // -----------------------------------------------------------------------

    /** "runtime.name", default "conduit". */
    const std::string &runtime_name() const noexcept;

    /** "components.module_root": parent of each component's private directory. Default "components". */
    const std::filesystem::path &module_root() const noexcept;

    /** "lifecycle.detach_timeout_ms", default 5000. */
    std::chrono::milliseconds detach_timeout() const noexcept;

    /** "lifecycle.drain_timeout_ms": wait for in-flight requests before a stop. Default 5000. */
    std::chrono::milliseconds drain_timeout() const noexcept;

    /** "lifecycle.cycle_policy" == "fail_dependents" (default "fail_all"). */
    bool fail_dependents_on_cycle() const noexcept;

    /** "pipeline.default_timeout_ms"; zero means no deadline. Default 0. */
    std::chrono::milliseconds pipeline_timeout() const noexcept;

    /** "logger.level", default "info". */
    const std::string &log_level() const noexcept;

    /// The merged JSON document, for component-specific sections.
    const nlohmann::json &raw() const noexcept;

    /// Overlays @p j on the current values. @throws std::invalid_argument as from_json().
    void apply_json(const nlohmann::json &j);

    /// Applies CONDUIT_MODULE_ROOT and CONDUIT_LOG_LEVEL when set.
    void apply_environment();

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace conduit::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
