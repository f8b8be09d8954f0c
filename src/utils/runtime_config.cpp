/**
 * @file runtime_config.cpp
 * @brief RuntimeConfig value type and its process-wide service.
 */
#include "cdt_service.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace conduit::utils
{

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Module-level state
// ---------------------------------------------------------------------------

static std::mutex g_config_path_mu;
static fs::path g_config_path_override; ///< Set by set_config_path() before startup.

namespace
{

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
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

template <typename T>
T read_typed(const nlohmann::json &section, const char *section_name, const char *key)
{
    try
    {
        return section.at(key).get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::invalid_argument(
            fmt::format("RuntimeConfig: '{}.{}' has the wrong type: {}", section_name, key, e.what()));
    }
}

std::chrono::milliseconds read_millis(const nlohmann::json &section, const char *section_name,
                                      const char *key)
{
    const auto ms = read_typed<int64_t>(section, section_name, key);
    if (ms < 0)
    {
        throw std::invalid_argument(
            fmt::format("RuntimeConfig: '{}.{}' must not be negative (got {})", section_name, key, ms));
    }
    return std::chrono::milliseconds(ms);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RuntimeConfig::Impl
// ---------------------------------------------------------------------------

struct RuntimeConfig::Impl
{
    std::string runtime_name{"conduit"};
    fs::path module_root{"components"};
    std::chrono::milliseconds detach_timeout{5000};
    std::chrono::milliseconds drain_timeout{5000};
    bool fail_dependents_on_cycle{false};
    std::chrono::milliseconds pipeline_timeout{0};
    std::string log_level{"info"};

    nlohmann::json merged = nlohmann::json::object();

    void apply_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            throw std::invalid_argument("RuntimeConfig: top-level JSON value must be an object");
        }
        if (j.contains("runtime"))
        {
            const auto &r = j.at("runtime");
            if (r.contains("name"))
                runtime_name = read_typed<std::string>(r, "runtime", "name");
        }
        if (j.contains("components"))
        {
            const auto &c = j.at("components");
            if (c.contains("module_root"))
                module_root = read_typed<std::string>(c, "components", "module_root");
        }
        if (j.contains("lifecycle"))
        {
            const auto &l = j.at("lifecycle");
            if (l.contains("detach_timeout_ms"))
                detach_timeout = read_millis(l, "lifecycle", "detach_timeout_ms");
            if (l.contains("drain_timeout_ms"))
                drain_timeout = read_millis(l, "lifecycle", "drain_timeout_ms");
            if (l.contains("cycle_policy"))
            {
                const auto policy = read_typed<std::string>(l, "lifecycle", "cycle_policy");
                if (policy == "fail_all")
                    fail_dependents_on_cycle = false;
                else if (policy == "fail_dependents")
                    fail_dependents_on_cycle = true;
                else
                    throw std::invalid_argument(fmt::format(
                        "RuntimeConfig: unknown lifecycle.cycle_policy '{}' "
                        "(expected 'fail_all' or 'fail_dependents')",
                        policy));
            }
        }
        if (j.contains("pipeline"))
        {
            const auto &p = j.at("pipeline");
            if (p.contains("default_timeout_ms"))
                pipeline_timeout = read_millis(p, "pipeline", "default_timeout_ms");
        }
        if (j.contains("logger"))
        {
            const auto &lg = j.at("logger");
            if (lg.contains("level"))
            {
                auto level = read_typed<std::string>(lg, "logger", "level");
                if (!Logger::level_from_string(level))
                {
                    throw std::invalid_argument(
                        fmt::format("RuntimeConfig: unknown logger.level '{}'", level));
                }
                log_level = std::move(level);
            }
        }
        json_merge(merged, j);
    }

    void apply_environment()
    {
        if (const char *env = std::getenv("CONDUIT_MODULE_ROOT"))
            module_root = env;
        if (const char *env = std::getenv("CONDUIT_LOG_LEVEL"))
        {
            if (Logger::level_from_string(env))
                log_level = env;
            else
                LOGGER_WARN("RuntimeConfig: ignoring unknown CONDUIT_LOG_LEVEL '{}'", env);
        }
    }
};

// ---------------------------------------------------------------------------
// RuntimeConfig public interface
// ---------------------------------------------------------------------------

RuntimeConfig::RuntimeConfig() : pImpl(std::make_unique<Impl>()) {}
RuntimeConfig::~RuntimeConfig() = default;
RuntimeConfig::RuntimeConfig(const RuntimeConfig &other)
    : pImpl(std::make_unique<Impl>(*other.pImpl))
{
}
RuntimeConfig &RuntimeConfig::operator=(const RuntimeConfig &other)
{
    if (this != &other)
    {
        pImpl = std::make_unique<Impl>(*other.pImpl);
    }
    return *this;
}
RuntimeConfig::RuntimeConfig(RuntimeConfig &&) noexcept = default;
RuntimeConfig &RuntimeConfig::operator=(RuntimeConfig &&) noexcept = default;

RuntimeConfig RuntimeConfig::from_json(const nlohmann::json &j)
{
    RuntimeConfig cfg;
    cfg.apply_json(j);
    return cfg;
}

RuntimeConfig RuntimeConfig::from_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        throw std::runtime_error(
            fmt::format("RuntimeConfig: cannot open config file '{}'", path.string()));
    }
    nlohmann::json j;
    try
    {
        f >> j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error(
            fmt::format("RuntimeConfig: cannot parse '{}': {}", path.string(), e.what()));
    }
    return from_json(j);
}

void RuntimeConfig::apply_json(const nlohmann::json &j)
{
    pImpl->apply_json(j);
}

void RuntimeConfig::apply_environment()
{
    pImpl->apply_environment();
}

const std::string &RuntimeConfig::runtime_name() const noexcept { return pImpl->runtime_name; }
const fs::path &RuntimeConfig::module_root() const noexcept { return pImpl->module_root; }
std::chrono::milliseconds RuntimeConfig::detach_timeout() const noexcept { return pImpl->detach_timeout; }
std::chrono::milliseconds RuntimeConfig::drain_timeout() const noexcept { return pImpl->drain_timeout; }
bool RuntimeConfig::fail_dependents_on_cycle() const noexcept { return pImpl->fail_dependents_on_cycle; }
std::chrono::milliseconds RuntimeConfig::pipeline_timeout() const noexcept { return pImpl->pipeline_timeout; }
const std::string &RuntimeConfig::log_level() const noexcept { return pImpl->log_level; }
const nlohmann::json &RuntimeConfig::raw() const noexcept { return pImpl->merged; }

// ---------------------------------------------------------------------------
// Process-wide instance
// ---------------------------------------------------------------------------

namespace
{
RuntimeConfig &mutable_instance()
{
    static RuntimeConfig instance;
    return instance;
}

void do_runtime_config_startup(const char * /*arg*/)
{
    fs::path path;
    {
        std::lock_guard lock(g_config_path_mu);
        path = g_config_path_override;
    }
    if (path.empty())
    {
        if (const char *env = std::getenv("CONDUIT_CONFIG_FILE"))
            path = env;
    }

    RuntimeConfig cfg = path.empty() ? RuntimeConfig{} : RuntimeConfig::from_file(path);
    cfg.apply_environment();

    if (auto lvl = Logger::level_from_string(cfg.log_level()))
    {
        Logger::instance().set_level(*lvl);
    }

    LOGGER_INFO("RuntimeConfig: source            = {}", path.empty() ? "<defaults>" : path.string());
    LOGGER_INFO("RuntimeConfig: runtime_name      = {}", cfg.runtime_name());
    LOGGER_INFO("RuntimeConfig: module_root       = {}", cfg.module_root().string());
    LOGGER_INFO("RuntimeConfig: detach_timeout    = {} ms", cfg.detach_timeout().count());
    LOGGER_INFO("RuntimeConfig: drain_timeout     = {} ms", cfg.drain_timeout().count());
    LOGGER_INFO("RuntimeConfig: cycle_policy      = {}",
                cfg.fail_dependents_on_cycle() ? "fail_dependents" : "fail_all");
    LOGGER_INFO("RuntimeConfig: pipeline_timeout  = {} ms", cfg.pipeline_timeout().count());

    mutable_instance() = std::move(cfg);
}

// Values stay readable after shutdown; only the logging side goes away.
void do_runtime_config_shutdown(const char * /*arg*/)
{
    LOGGER_DEBUG("RuntimeConfig: service stopped");
}
} // namespace

// static
void RuntimeConfig::set_config_path(const fs::path &path)
{
    std::lock_guard lock(g_config_path_mu);
    g_config_path_override = path;
}

// static
const RuntimeConfig &RuntimeConfig::get_instance()
{
    return mutable_instance();
}

// static
ModuleDef RuntimeConfig::GetLifecycleModule()
{
    ModuleDef module("conduit::utils::RuntimeConfig");
    module.add_dependency("conduit::utils::Logger");
    module.set_startup(&do_runtime_config_startup);
    module.set_shutdown(&do_runtime_config_shutdown, std::chrono::milliseconds(500));
    return module;
}

} // namespace conduit::utils
