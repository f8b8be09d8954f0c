/**
 * @file module_loader.cpp
 * @brief Static-factory and shared-library implementations of the loader capability.
 */
#include "cdt_service.hpp"
#include "runtime/component.hpp"
#include "runtime/module_loader.hpp"

#include <mutex>
#include <stdexcept>
#include <system_error>

namespace conduit::runtime
{

namespace
{
using LoadResult = utils::Result<ComponentFactory, LoadError>;

LoadResult reject(const ModuleResolution &resolution)
{
    return LoadResult::error(
        LoadError{RuntimeErrorCode::RestrictedModule, resolution.module_name, resolution.error});
}

LoadResult load_failure(const std::string &module_name, std::string message)
{
    return LoadResult::error(
        LoadError{RuntimeErrorCode::LoadFailure, module_name, std::move(message)});
}

using AbiVersionFn = uint32_t (*)();
using CreateFn = Component *(*)();
using DestroyFn = void (*)(Component *);
} // namespace

// ============================================================================
// StaticFactoryLoader
// ============================================================================

bool StaticFactoryLoader::register_factory(const std::string &module_name, ComponentFactory factory)
{
    if (module_name.empty() || !factory)
    {
        throw std::invalid_argument(
            "StaticFactoryLoader: module name and factory must not be empty.");
    }
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_factories.emplace(module_name, std::move(factory)).second;
}

bool StaticFactoryLoader::unregister_factory(const std::string &module_name)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_factories.erase(module_name) != 0;
}

bool StaticFactoryLoader::contains(const std::string &module_name) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_factories.find(module_name) != m_factories.end();
}

std::vector<std::string> StaticFactoryLoader::module_names() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_factories.size());
    for (const auto &[name, factory] : m_factories)
    {
        names.push_back(name);
    }
    return names;
}

utils::Result<ComponentFactory, LoadError> StaticFactoryLoader::load(const std::string &module_name,
                                                                     LoadBoundary &boundary)
{
    const auto resolution = boundary.resolve(module_name);
    if (resolution.is_rejected())
    {
        return reject(resolution);
    }
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_factories.find(module_name);
    if (it == m_factories.end())
    {
        return load_failure(module_name,
                            fmt::format("no factory registered for module '{}'", module_name));
    }
    return LoadResult::ok(it->second);
}

std::shared_ptr<StaticFactoryLoader> StaticFactoryLoader::global()
{
    static const auto instance = std::make_shared<StaticFactoryLoader>();
    return instance;
}

StaticFactoryRegistrar::StaticFactoryRegistrar(const char *module_name, ComponentFactory factory)
{
    if (!StaticFactoryLoader::global()->register_factory(module_name, std::move(factory)))
    {
        CDT_PANIC("StaticFactoryRegistrar: module '{}' registered twice.", module_name);
    }
}

// ============================================================================
// DynamicLibraryLoader
// ============================================================================

DynamicLibraryLoader::DynamicLibraryLoader(std::vector<std::filesystem::path> search_dirs)
    : m_search_dirs(std::move(search_dirs))
{
}

std::filesystem::path DynamicLibraryLoader::locate_shared(const std::string &module_name) const
{
    const auto file_name = platform::shared_library_filename(module_name);
    for (const auto &dir : m_search_dirs)
    {
        std::error_code ec;
        const auto candidate = dir / file_name;
        if (std::filesystem::is_regular_file(candidate, ec))
        {
            return candidate;
        }
    }
    // Left to the platform loader's search path.
    return file_name;
}

utils::Result<ComponentFactory, LoadError> DynamicLibraryLoader::load(const std::string &module_name,
                                                                      LoadBoundary &boundary)
{
    const auto resolution = boundary.resolve(module_name);
    if (resolution.is_rejected())
    {
        return reject(resolution);
    }
    const auto path = resolution.source == ModuleSource::Private ? resolution.path
                                                                  : locate_shared(module_name);

    auto opened = DynamicLibrary::open(path);
    if (opened.is_error())
    {
        return load_failure(module_name, fmt::format("cannot open '{}': {}", path.string(),
                                                     opened.error()));
    }
    DynamicLibrary library = std::move(opened).content();

    const auto abi = library.symbol_as<AbiVersionFn>(CONDUIT_COMPONENT_ABI_SYMBOL);
    const auto create = library.symbol_as<CreateFn>(CONDUIT_COMPONENT_CREATE_SYMBOL);
    const auto destroy = library.symbol_as<DestroyFn>(CONDUIT_COMPONENT_DESTROY_SYMBOL);
    if (abi == nullptr || create == nullptr || destroy == nullptr)
    {
        return load_failure(module_name,
                            fmt::format("'{}' does not export the component entry points",
                                        path.string()));
    }
    const uint32_t version = abi();
    if (version != kComponentAbiVersion)
    {
        return load_failure(module_name,
                            fmt::format("'{}' was built for component ABI {} (runtime is {})",
                                        path.string(), version, kComponentAbiVersion));
    }

    // The boundary keeps the library loaded until after the instance is released.
    const DynamicLibrary *owned = boundary.adopt(std::move(library));
    LOGGER_INFO("DynamicLibraryLoader: loaded '{}' for component '{}' from '{}' ({}).",
                module_name, boundary.component_id(), owned->path().string(),
                to_string(resolution.source));

    ComponentFactory factory = [create, destroy]() -> std::shared_ptr<Component>
    {
        Component *raw = create();
        if (raw == nullptr)
        {
            return nullptr;
        }
        return std::shared_ptr<Component>(raw, destroy);
    };
    return LoadResult::ok(std::move(factory));
}

} // namespace conduit::runtime
