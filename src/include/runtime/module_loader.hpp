#pragma once
/**
 * @file module_loader.hpp
 * @brief The loader capability: given a module name and a boundary, produce a factory
 *        for the component the module implements.
 *
 * Two loaders ship with the runtime:
 *  - StaticFactoryLoader: constructor functions compiled into the host, keyed by module
 *    name. Hot reload then re-runs the factory; the code itself is not replaced.
 *  - DynamicLibraryLoader: opens the module as a shared library through the component's
 *    boundary and calls its exported entry point.
 *
 * Both consult the boundary first, so a module the boundary rejects is never loaded.
 */
#include "conduit_runtime_export.h"
#include "runtime/isolation_boundary.hpp"
#include "runtime/runtime_errors.hpp"
#include "utils/result.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::runtime
{

class Component;

using ComponentFactory = std::function<std::shared_ptr<Component>()>;

struct LoadError
{
    RuntimeErrorCode code{RuntimeErrorCode::LoadFailure}; ///< LoadFailure or RestrictedModule.
    std::string module_name;
    std::string message;
};

/**
 * @brief Abstract loader capability.
 */
class CONDUIT_RUNTIME_EXPORT ModuleLoader
{
  public:
    virtual ~ModuleLoader() = default;

    /**
     * @brief Resolves @p module_name through @p boundary and returns a component factory.
     * @details Code the loader opens is handed to the boundary, so it lives exactly as long
     *          as the boundary does.
     */
    virtual utils::Result<ComponentFactory, LoadError> load(const std::string &module_name,
                                                            LoadBoundary &boundary) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Compiled-in factories keyed by module name.
 */
class CONDUIT_RUNTIME_EXPORT StaticFactoryLoader : public ModuleLoader
{
  public:
    /// @return false if a factory is already registered under @p module_name.
    bool register_factory(const std::string &module_name, ComponentFactory factory);
    bool unregister_factory(const std::string &module_name);
    bool contains(const std::string &module_name) const;
    std::vector<std::string> module_names() const;

    utils::Result<ComponentFactory, LoadError> load(const std::string &module_name,
                                                    LoadBoundary &boundary) override;

    std::string name() const override { return "StaticFactoryLoader"; }

    /// Loader filled by CONDUIT_REGISTER_STATIC_COMPONENT at static-initialization time.
    static std::shared_ptr<StaticFactoryLoader> global();

  private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, ComponentFactory> m_factories;
};

/// Registers a factory with StaticFactoryLoader::global() during static initialization.
struct CONDUIT_RUNTIME_EXPORT StaticFactoryRegistrar
{
    StaticFactoryRegistrar(const char *module_name, ComponentFactory factory);
};

/**
 * @brief Loads components from shared libraries.
 *
 * The library must export the entry points declared by CONDUIT_EXPORT_COMPONENT:
 * `conduit_component_abi_version`, `conduit_create_component` and
 * `conduit_destroy_component`.
 *
 * A module the boundary resolves as Private is opened from its private path. A module
 * resolved as SharedCore is looked up in the loader's search directories, and failing
 * that by its platform file name on the system search path.
 */
class CONDUIT_RUNTIME_EXPORT DynamicLibraryLoader : public ModuleLoader
{
  public:
    explicit DynamicLibraryLoader(std::vector<std::filesystem::path> search_dirs = {});

    utils::Result<ComponentFactory, LoadError> load(const std::string &module_name,
                                                    LoadBoundary &boundary) override;

    std::string name() const override { return "DynamicLibraryLoader"; }

    const std::vector<std::filesystem::path> &search_dirs() const noexcept
    {
        return m_search_dirs;
    }

  private:
    std::filesystem::path locate_shared(const std::string &module_name) const;

    std::vector<std::filesystem::path> m_search_dirs;
};

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

/**
 * @brief Registers `Type` (default-constructible Component) under @p module_name with
 *        StaticFactoryLoader::global().
 */
#define CONDUIT_REGISTER_STATIC_COMPONENT(module_name, Type)                                        \
    static const ::conduit::runtime::StaticFactoryRegistrar CONDUIT_STATIC_REGISTRAR_NAME(         \
        __LINE__)(module_name, []() { return std::make_shared<Type>(); })

#define CONDUIT_STATIC_REGISTRAR_CONCAT_(a, b) a##b
#define CONDUIT_STATIC_REGISTRAR_CONCAT(a, b) CONDUIT_STATIC_REGISTRAR_CONCAT_(a, b)
#define CONDUIT_STATIC_REGISTRAR_NAME(line)                                                         \
    CONDUIT_STATIC_REGISTRAR_CONCAT(conduit_static_component_registrar_, line)
