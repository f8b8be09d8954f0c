/**
 * @file service_lifecycle.cpp
 * @brief ModuleDef and the ServiceLifecycle singleton.
 *
 * 1.  **Registration**: `register_module()` moves each ModuleDef's internal definition
 *     into a name-keyed table.
 * 2.  **Initialization**: `initialize()` builds a `runtime::DependencyGraph` from the
 *     table, resolves the start order and runs each startup callback in sequence. Any
 *     resolution error or startup exception aborts the process.
 * 3.  **Finalization**: `finalize()` runs the shutdown callbacks of the started
 *     services in reverse order, each bounded by `run_with_timeout()`.
 */
#include "cdt_base.hpp"
#include "runtime/dependency_graph.hpp"
#include "utils/service_lifecycle.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>

namespace
{
constexpr size_t kDebugInfoReserveBytes = 1024;

/**
 * @brief Validates a service name: non-empty, within MAX_MODULE_NAME_LEN.
 * @param param_name For error messages (e.g., "module name", "dependency name").
 * @throws std::invalid_argument if `name` is empty.
 * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
 */
void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > conduit::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(conduit::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

void validate_callback_arg(std::string_view arg, const char *which)
{
    if (arg.size() > conduit::utils::ModuleDef::MAX_CALLBACK_PARAM_STRLEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + which +
                                " argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
    }
}
} // namespace

namespace conduit::utils
{

struct ServiceShutdownDef
{
    std::function<void()> func;
    std::chrono::milliseconds timeout{0};
};

struct ServiceDef
{
    std::string name;
    std::set<std::string> dependencies;
    std::function<void()> startup;
    ServiceShutdownDef shutdown;
};

class ModuleDefImpl
{
  public:
    ServiceDef def;
};

// ============================================================================
// ModuleDef
// ============================================================================

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->def.name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (pImpl != nullptr && !dependency_name.empty())
    {
        validate_module_name(dependency_name, "dependency name");
        pImpl->def.dependencies.emplace(dependency_name);
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        pImpl->def.startup = [startup_func]() { startup_func(nullptr); };
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        validate_callback_arg(arg, "startup");
        pImpl->def.startup = [startup_func, arg_copy = std::string(arg)]()
        { startup_func(arg_copy.c_str()); };
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        pImpl->def.shutdown.func = [shutdown_func]() { shutdown_func(nullptr); };
        pImpl->def.shutdown.timeout = timeout;
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        validate_callback_arg(arg, "shutdown");
        pImpl->def.shutdown.func = [shutdown_func, arg_copy = std::string(arg)]()
        { shutdown_func(arg_copy.c_str()); };
        pImpl->def.shutdown.timeout = timeout;
    }
}

// ============================================================================
// ServiceLifecycleImpl
// ============================================================================

class ServiceLifecycleImpl
{
  public:
    ServiceLifecycleImpl()
        : m_pid(platform::get_pid()), m_app_name(platform::get_executable_name())
    {
    }

    void register_module(ModuleDef &&module_def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);

    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};

    mutable std::mutex m_mutex;
    std::map<std::string, ServiceDef, std::less<>> m_services;
    std::vector<std::string> m_started;

  private:
    [[noreturn]] void print_status_and_abort(const std::string &msg, const std::string &mod = "");

    uint64_t m_pid;
    std::string m_app_name;
};

void ServiceLifecycleImpl::register_module(ModuleDef &&module_def)
{
    if (module_def.pImpl == nullptr)
    {
        CDT_PANIC("[CDT_Lifecycle] register_module() called with a moved-from ModuleDef.");
    }
    if (m_is_initialized.load(std::memory_order_acquire))
    {
        CDT_PANIC("[CDT_Lifecycle] [{}:{}] register_module('{}') called after initialize(). "
                  "Services must be registered before the application starts.",
                  m_app_name, m_pid, module_def.pImpl->def.name);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto def = std::move(module_def.pImpl->def);
    if (m_services.find(def.name) != m_services.end())
    {
        CDT_PANIC("[CDT_Lifecycle] [{}:{}] service '{}' registered twice.", m_app_name, m_pid,
                  def.name);
    }
    auto name = def.name;
    m_services.emplace(std::move(name), std::move(def));
}

void ServiceLifecycleImpl::print_status_and_abort(const std::string &msg, const std::string &mod)
{
    std::string status;
    for (const auto &[name, def] : m_services)
    {
        const bool started = std::find(m_started.begin(), m_started.end(), name) != m_started.end();
        status += fmt::format("     - {:<40} {}\n", name, started ? "started" : "not started");
    }
    CDT_PANIC("[CDT_Lifecycle] [{}:{}] FATAL{}: {}\n     Service status:\n{}", m_app_name, m_pid,
              mod.empty() ? std::string{} : fmt::format(" in service '{}'", mod), msg, status);
}

void ServiceLifecycleImpl::initialize(std::source_location loc)
{
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info += fmt::format("[CDT_Lifecycle] [{}]:PID[{}]\n"
                              "     **** initialize() triggered from {} ({}:{})\n"
                              "     -> Initializing application...\n",
                              m_app_name, m_pid, loc.function_name(),
                              format_tools::filename_only(loc.file_name()), loc.line());

    runtime::DependencyGraph graph;
    for (const auto &[name, def] : m_services)
    {
        graph.add_node(name, def.dependencies);
    }
    auto plan = graph.resolve();
    if (plan.is_error())
    {
        print_status_and_abort(plan.error().message);
    }

    for (const auto &name : plan.content().start_order)
    {
        auto &def = m_services.find(name)->second;
        debug_info += fmt::format("     -> Starting service: '{}'...", name);
        try
        {
            if (def.startup)
            {
                def.startup();
            }
        }
        catch (const std::exception &e)
        {
            CDT_DEBUG("{}", debug_info);
            print_status_and_abort("Exception during startup: " + std::string(e.what()), name);
        }
        catch (...)
        {
            CDT_DEBUG("{}", debug_info);
            print_status_and_abort("Unknown exception during startup.", name);
        }
        m_started.push_back(name);
        debug_info += "done.\n";
    }
    debug_info += "     -> Application initialization complete.\n";
    CDT_DEBUG("{}", debug_info);
}

void ServiceLifecycleImpl::finalize(std::source_location loc)
{
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info +=
        fmt::format("[CDT_Lifecycle] [{}]:PID[{}]\n"
                    "     **** finalize() called, associated with a constructor from {} ({}:{}):\n"
                    "     <- Finalizing application...\n",
                    m_app_name, m_pid, loc.function_name(),
                    format_tools::filename_only(loc.file_name()), loc.line());

    for (auto it = m_started.rbegin(); it != m_started.rend(); ++it)
    {
        const auto &def = m_services.find(*it)->second;
        debug_info += fmt::format("     <- Shutting down service: '{}'...", *it);
        const auto outcome = run_with_timeout(def.shutdown.func, def.shutdown.timeout);
        if (outcome.success)
        {
            debug_info += "done.\n";
        }
        else if (outcome.timed_out)
        {
            debug_info += fmt::format("TIMEOUT after {} ms (abandoned).\n",
                                      def.shutdown.timeout.count());
        }
        else
        {
            debug_info += fmt::format("FAILED: {}\n", outcome.exception_msg);
        }
    }
    m_started.clear();
    debug_info += "     <- Application finalization complete.\n";
    CDT_DEBUG("{}", debug_info);
}

// ============================================================================
// ServiceLifecycle
// ============================================================================

ServiceLifecycle &ServiceLifecycle::instance()
{
    static ServiceLifecycle instance;
    return instance;
}

ServiceLifecycle::ServiceLifecycle() : pImpl(std::make_unique<ServiceLifecycleImpl>()) {}
ServiceLifecycle::~ServiceLifecycle() = default;

void ServiceLifecycle::register_module(ModuleDef &&module_def)
{
    pImpl->register_module(std::move(module_def));
}

void ServiceLifecycle::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void ServiceLifecycle::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool ServiceLifecycle::is_initialized() const noexcept
{
    return pImpl->m_is_initialized.load(std::memory_order_acquire);
}

bool ServiceLifecycle::is_finalized() const noexcept
{
    return pImpl->m_is_finalized.load(std::memory_order_acquire);
}

std::vector<std::string> ServiceLifecycle::started_modules() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    return pImpl->m_started;
}

} // namespace conduit::utils
