#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe definition of a process service for ServiceLifecycle registration.
 */
#include "conduit_runtime_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

// Disable warning C4251 on MSVC for the Pimpl unique_ptr member.
#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::utils
{

class ModuleDefImpl;
class ServiceLifecycle; // Forward-declaration for the friend class
class ServiceLifecycleImpl;

/**
 * @brief Startup and shutdown callback type for services.
 *
 * A C-style function pointer keeps the calling convention stable across shared-library
 * boundaries. `arg` is `nullptr` when no argument was supplied.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for a service definition (logger, configuration, ...).
 *
 * Movable but not copyable. Ownership passes to the ServiceLifecycle on registration.
 * Names longer than `MAX_MODULE_NAME_LEN` are rejected with `std::length_error`.
 */
class CONDUIT_RUNTIME_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /**
     * @param name Unique service name, e.g. `"conduit::utils::Logger"`.
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /**
     * @brief Declares that this service needs @p dependency_name started first.
     * @details An empty name is ignored.
     * @throws std::length_error if the name exceeds `MAX_MODULE_NAME_LEN`.
     */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);

    /// @throws std::length_error if `arg.size() > MAX_CALLBACK_PARAM_STRLEN`.
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @param timeout Maximum time the callback may run before it is abandoned.
     *                `0` waits for completion.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                      std::string_view arg);

  private:
    friend class ServiceLifecycle;
    friend class ServiceLifecycleImpl;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace conduit::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
