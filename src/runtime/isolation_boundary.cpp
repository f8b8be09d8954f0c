/**
 * @file isolation_boundary.cpp
 * @brief Module visibility policy and library ownership for one component.
 */
#include "cdt_service.hpp"
#include "runtime/isolation_boundary.hpp"

#include <algorithm>
#include <system_error>

namespace conduit::runtime
{

namespace
{
std::atomic<uint64_t> g_next_boundary_id{1};

bool contains_ci(const std::set<std::string> &names, std::string_view name)
{
    return std::any_of(names.begin(), names.end(),
                       [name](const std::string &n) { return format_tools::iequals(n, name); });
}
} // namespace

const char *to_string(ModuleSource source) noexcept
{
    switch (source)
    {
    case ModuleSource::SharedCore:
        return "SharedCore";
    case ModuleSource::Private:
        return "Private";
    case ModuleSource::Rejected:
        return "Rejected";
    default:
        return "Unknown";
    }
}

// ============================================================================
// SharedCore
// ============================================================================

const std::vector<std::string_view> &SharedCore::exact_names() noexcept
{
    static const std::vector<std::string_view> names = {
        "conduit.api", "conduit.runtime", "c", "m", "dl", "pthread", "stdc++", "gcc_s", "fmt"};
    return names;
}

const std::vector<std::string_view> &SharedCore::prefixes() noexcept
{
    static const std::vector<std::string_view> names = {"conduit.", "std."};
    return names;
}

bool SharedCore::contains(std::string_view module_name) noexcept
{
    const auto &exact = exact_names();
    if (std::any_of(exact.begin(), exact.end(),
                    [module_name](std::string_view n) { return format_tools::iequals(n, module_name); }))
    {
        return true;
    }
    const auto &pre = prefixes();
    return std::any_of(pre.begin(), pre.end(), [module_name](std::string_view p)
                       { return format_tools::istarts_with(module_name, p); });
}

// ============================================================================
// LoadBoundary
// ============================================================================

LoadBoundary::LoadBoundary(std::string component_id, std::filesystem::path private_dir,
                           IsolationRequirements requirements)
    : m_component_id(std::move(component_id)), m_private_dir(std::move(private_dir)),
      m_requirements(std::move(requirements)),
      m_instance_id(g_next_boundary_id.fetch_add(1, std::memory_order_relaxed))
{
    LOGGER_DEBUG("LoadBoundary[{}#{}]: created (level={}, private_dir='{}', allowed={}, "
                 "blocked={}).",
                 m_component_id, m_instance_id, to_string(m_requirements.level),
                 m_private_dir.string(), m_requirements.allowed_modules.size(),
                 m_requirements.blocked_modules.size());
}

LoadBoundary::~LoadBoundary()
{
    release();
}

bool LoadBoundary::is_blocked(std::string_view module_name) const
{
    return contains_ci(m_requirements.blocked_modules, module_name);
}

bool LoadBoundary::is_allowed(std::string_view module_name) const
{
    return m_requirements.allowed_modules.empty() ||
           contains_ci(m_requirements.allowed_modules, module_name);
}

std::optional<std::filesystem::path> LoadBoundary::find_private(std::string_view module_name) const
{
    if (m_private_dir.empty() || module_name.empty())
    {
        return std::nullopt;
    }
    const std::string name(module_name);
    for (const auto &candidate :
         {m_private_dir / name, m_private_dir / platform::shared_library_filename(name)})
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec))
        {
            return candidate;
        }
    }
    return std::nullopt;
}

ModuleResolution LoadBoundary::resolve(std::string_view module_name) const
{
    ModuleResolution res;
    res.module_name = std::string(module_name);

    if (SharedCore::contains(module_name) || m_requirements.level == IsolationLevel::None)
    {
        res.source = ModuleSource::SharedCore;
    }
    else if (is_blocked(module_name))
    {
        res.source = ModuleSource::Rejected;
        res.error = fmt::format("RestrictedModule({}): blocked for component '{}'", module_name,
                                m_component_id);
    }
    else if (!is_allowed(module_name))
    {
        res.source = ModuleSource::Rejected;
        res.error = fmt::format("RestrictedModule({}): not in the allow-list of component '{}'",
                                module_name, m_component_id);
    }
    else if (auto path = (m_requirements.level == IsolationLevel::Standard)
                             ? find_private(module_name)
                             : std::nullopt)
    {
        res.source = ModuleSource::Private;
        res.path = std::move(*path);
    }
    else
    {
        res.source = ModuleSource::SharedCore;
    }

    if (res.is_rejected())
    {
        LOGGER_WARN("LoadBoundary[{}#{}]: {}", m_component_id, m_instance_id, res.error);
    }
    else
    {
        LOGGER_TRACE("LoadBoundary[{}#{}]: '{}' -> {}", m_component_id, m_instance_id,
                     module_name, to_string(res.source));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_resolution_count;
    m_history.push_back(res);
    if (m_history.size() > MAX_RESOLUTION_HISTORY)
    {
        m_history.pop_front();
    }
    return res;
}

DynamicLibrary *LoadBoundary::adopt(DynamicLibrary &&library)
{
    auto owned = std::make_unique<DynamicLibrary>(std::move(library));
    DynamicLibrary *raw = owned.get();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_libraries.push_back(std::move(owned));
    return raw;
}

size_t LoadBoundary::loaded_library_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_libraries.size();
}

void LoadBoundary::release() noexcept
{
    std::vector<std::unique_ptr<DynamicLibrary>> libraries;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        libraries.swap(m_libraries);
    }
    while (!libraries.empty())
    {
        libraries.back()->close();
        libraries.pop_back();
    }
}

std::vector<ModuleResolution> LoadBoundary::resolution_history() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_history.begin(), m_history.end()};
}

uint64_t LoadBoundary::resolution_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_resolution_count;
}

ModuleResolution Resolve(const LoadBoundary &boundary, std::string_view module_name)
{
    return boundary.resolve(module_name);
}

} // namespace conduit::runtime
