#pragma once
/**
 * @file service_lifecycle.hpp
 * @brief Ordered startup and shutdown of process-wide services.
 *
 * Process services (the logger, the runtime configuration, a host's own singletons)
 * describe themselves with a `ModuleDef`: a name, the names of the services they need,
 * a startup callback and a shutdown callback with a timeout. The `ServiceLifecycle`
 * singleton orders them with the component dependency resolver, starts them in order,
 * and shuts them down in exact reverse order.
 *
 * Typical use is one `LifecycleGuard` at the top of `main()`:
 * @code
 * int main()
 * {
 *     conduit::utils::LifecycleGuard guard(conduit::utils::MakeModDefList(
 *         conduit::utils::Logger::GetLifecycleModule(),
 *         conduit::utils::RuntimeConfig::GetLifecycleModule()));
 *     // The guard's constructor called InitializeApp(); services are up.
 *     ...
 *     // The guard's destructor calls FinalizeApp().
 * }
 * @endcode
 *
 * A dependency cycle, an unknown dependency, or an exception thrown by a startup
 * callback is fatal: the process aborts with a stack trace. These are programming
 * errors in how the host wires its services, not runtime conditions.
 */
#include "cdt_platform.hpp"
#include "utils/debug_info.hpp"
#include "utils/format_tools.hpp"
#include "utils/module_def.hpp"

#include <atomic>
#include <memory>
#include <source_location>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::utils
{

class ServiceLifecycleImpl;

/// Constructs a vector<ModuleDef> by moving the supplied ModuleDef arguments.
// Call-site: MakeModDefList(std::move(a), std::move(b)) or MakeModDefList(MyFactory(), ...)
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

/**
 * @class ServiceLifecycle
 * @brief Process-wide singleton that owns the registered service definitions.
 */
class CONDUIT_RUNTIME_EXPORT ServiceLifecycle
{
  public:
    static ServiceLifecycle &instance();

    /**
     * @brief Takes ownership of a service definition.
     * @details Must be called before initialize(). Registration afterwards is fatal.
     *          Registering the same name twice is fatal.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts every registered service in dependency order. Idempotent.
     */
    void initialize(std::source_location loc);

    /**
     * @brief Shuts down started services in reverse startup order. Idempotent.
     * @details Each shutdown callback is bounded by its timeout. A callback that times
     *          out or throws is reported and shutdown continues with the next service.
     */
    void finalize(std::source_location loc);

    bool is_initialized() const noexcept;
    bool is_finalized() const noexcept;

    /// Names of the services that started successfully, in startup order.
    std::vector<std::string> started_modules() const;

  private:
    ServiceLifecycle();
    ~ServiceLifecycle();
    ServiceLifecycle(const ServiceLifecycle &) = delete;
    ServiceLifecycle &operator=(const ServiceLifecycle &) = delete;

    std::unique_ptr<ServiceLifecycleImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    ServiceLifecycle::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return ServiceLifecycle::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return ServiceLifecycle::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    ServiceLifecycle::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    ServiceLifecycle::instance().finalize(loc);
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the service lifecycle.
 *
 * The first guard constructed in the process registers its modules and initializes the
 * application; its destructor finalizes it. Later guards are no-ops and their modules
 * are ignored.
 *
 * @warning Static objects destroyed after the owning guard must not use lifecycle
 *          services. Their destruction order relative to the guard is unspecified.
 */
class LifecycleGuard
{
  private:
    std::source_location m_loc;

  public:
    LifecycleGuard(std::source_location loc = std::source_location::current()) : m_loc(loc)
    {
        CDT_DEBUG("[CDT_Lifecycle] LifecycleGuard constructed in function {} with no modules. "
                  "({}:{})",
                  m_loc.function_name(), ::conduit::format_tools::filename_only(m_loc.file_name()),
                  m_loc.line());
        init_owner_if_first({});
    }

    // Usage: LifecycleGuard guard(Logger::GetLifecycleModule());
    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    // Usage: LifecycleGuard guard(MakeModDefList(ModuleDef("A"), ModuleDef("B")));
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            CDT_DEBUG("[CDT_Lifecycle] LifecycleGuard is being destructed as owner. "
                      "Constructor was located in function {}. ({}:{})",
                      m_loc.function_name(),
                      ::conduit::format_tools::filename_only(m_loc.file_name()), m_loc.line());
            ::conduit::utils::FinalizeApp(m_loc);
        }
    }

    bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                ::conduit::utils::RegisterModule(std::move(m));
            }
            // Initialize even with no modules so the lifecycle is marked started.
            ::conduit::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            CDT_DEBUG("[CDT_Lifecycle] [{}:{}] WARNING: LifecycleGuard constructed but an owner "
                      "already exists. This guard is a no-op; provided modules (if any) were "
                      "ignored. Constructor was located in function {}. ({}:{}).",
                      ::conduit::platform::get_executable_name(), ::conduit::platform::get_pid(),
                      m_loc.function_name(),
                      ::conduit::format_tools::filename_only(m_loc.file_name()), m_loc.line());
            ::conduit::debug::print_stack_trace();
        }
    }

    bool m_is_owner{false};
};

} // namespace conduit::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
