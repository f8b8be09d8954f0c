#pragma once
/**
 * @file isolation_boundary.hpp
 * @brief Per-component module visibility policy and owner of the component's loaded code.
 *
 * A LoadBoundary answers one question for one component: where does a module it
 * references come from? The answer is one of
 *
 *  - SharedCore: the trusted host copy (the runtime's own API and the platform runtime
 *                libraries are always answered this way),
 *  - Private:    the component's own copy under its private directory,
 *  - Rejected:   the component is not permitted to use the module.
 *
 * Evaluation order for a module name:
 *  1. member of the shared core          -> SharedCore (any level)
 *  2. level None                         -> SharedCore
 *  3. member of blocked_modules          -> Rejected
 *  4. allow-list present, name not in it -> Rejected
 *  5. level Standard, private copy found -> Private
 *  6. otherwise                          -> SharedCore
 *
 * Module names compare ASCII case-insensitively. The boundary decides where a module
 * comes from, never how it is loaded; loaders hand the libraries they open to the
 * boundary, which closes them in reverse order when it is destroyed.
 */
#include "conduit_runtime_export.h"
#include "runtime/component_descriptor.hpp"
#include "runtime/dynamic_library.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::runtime
{

enum class ModuleSource : int
{
    SharedCore = 0,
    Private,
    Rejected
};

CONDUIT_RUNTIME_EXPORT const char *to_string(ModuleSource source) noexcept;

struct ModuleResolution
{
    ModuleSource source{ModuleSource::SharedCore};
    std::string module_name;
    std::filesystem::path path; ///< Set for Private resolutions.
    std::string error;          ///< Set for Rejected resolutions.

    bool is_rejected() const noexcept { return source == ModuleSource::Rejected; }
};

/**
 * @brief The process-wide trusted module set.
 *
 * Fixed at compile time: exact names for the runtime API and the platform runtime
 * libraries, plus the "conduit." and "std." name prefixes.
 */
class CONDUIT_RUNTIME_EXPORT SharedCore
{
  public:
    static bool contains(std::string_view module_name) noexcept;
    static const std::vector<std::string_view> &exact_names() noexcept;
    static const std::vector<std::string_view> &prefixes() noexcept;
};

class CONDUIT_RUNTIME_EXPORT LoadBoundary
{
  public:
    /// Number of most recent resolutions kept by resolution_history().
    static constexpr size_t MAX_RESOLUTION_HISTORY = 256;

    LoadBoundary(std::string component_id, std::filesystem::path private_dir,
                 IsolationRequirements requirements);
    ~LoadBoundary();

    LoadBoundary(const LoadBoundary &) = delete;
    LoadBoundary &operator=(const LoadBoundary &) = delete;
    LoadBoundary(LoadBoundary &&) = delete;
    LoadBoundary &operator=(LoadBoundary &&) = delete;

    const std::string &component_id() const noexcept { return m_component_id; }
    const std::filesystem::path &private_dir() const noexcept { return m_private_dir; }
    const IsolationRequirements &requirements() const noexcept { return m_requirements; }

    /// Process-unique, increasing; a reloaded component gets a boundary with a new id.
    uint64_t instance_id() const noexcept { return m_instance_id; }

    /// Classifies @p module_name. Records the outcome in resolution_history().
    ModuleResolution resolve(std::string_view module_name) const;

    /**
     * @brief Looks for a private copy of @p module_name.
     * @details Looks for `<private_dir>/<name>` then `<private_dir>/<platform library file name>`.
     */
    std::optional<std::filesystem::path> find_private(std::string_view module_name) const;

    bool is_blocked(std::string_view module_name) const;
    bool is_allowed(std::string_view module_name) const;

    /// Takes ownership of @p library. Returns a pointer that stays valid until release().
    DynamicLibrary *adopt(DynamicLibrary &&library);

    size_t loaded_library_count() const;

    /// Closes adopted libraries in reverse order of adoption.
    void release() noexcept;

    /// The last MAX_RESOLUTION_HISTORY resolutions, oldest first.
    std::vector<ModuleResolution> resolution_history() const;

    /// Resolutions produced since construction, including those dropped from the history.
    uint64_t resolution_count() const;

  private:
    std::string m_component_id;
    std::filesystem::path m_private_dir;
    IsolationRequirements m_requirements;
    uint64_t m_instance_id;

    mutable std::mutex m_mutex;
    std::vector<std::unique_ptr<DynamicLibrary>> m_libraries;
    mutable std::deque<ModuleResolution> m_history;
    mutable uint64_t m_resolution_count{0};
};

/// Same as `boundary.resolve(module_name)`.
CONDUIT_RUNTIME_EXPORT ModuleResolution Resolve(const LoadBoundary &boundary,
                                                std::string_view module_name);

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
