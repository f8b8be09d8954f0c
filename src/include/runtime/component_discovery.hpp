#pragma once
/**
 * @file component_discovery.hpp
 * @brief Finds packaged components under plugin directories and describes them.
 *
 * Each immediate subdirectory of a root is a candidate component; its name is the
 * component id (it is also the component's private directory when the root is the
 * lifecycle manager's module_root). A candidate is described by
 *
 *  - `<dir>/component.json`, when present, or else
 *  - a shared library named after the directory (`<dir>/lib<dir>.so` on Linux), which
 *    yields a descriptor with defaults and the directory name as entry module.
 *
 * Other subdirectories are ignored. Roots are scanned in the order given and their
 * subdirectories in name order; when an id appears under two roots the first wins.
 *
 * Manifest:
 * @code{.json}
 * {
 *   "id": "greeter",                       // optional; must equal the directory name
 *   "name": "Greeter",
 *   "version": "2.1.0",
 *   "description": "Replies to greetings",
 *   "dependencies": ["auth", "store"],
 *   "optional_dependencies": ["metrics"],
 *   "entry_module": "greeter_impl",
 *   "imports": ["zlib"],
 *   "isolation": { "level": "strict", "allowed_modules": ["zlib"], "blocked_modules": [] },
 *   "metadata": { "owner": "edge-team" }
 * }
 * @endcode
 *
 * Discovery never loads code. A directory that cannot be described is reported as a
 * DiscoveryFailure error and skipped; the other components are still returned.
 */
#include "conduit_runtime_export.h"
#include "runtime/component_descriptor.hpp"
#include "runtime/runtime_errors.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::utils
{
class RuntimeConfig;
}

namespace conduit::runtime
{

/// File name of a component manifest inside its directory.
inline constexpr const char *COMPONENT_MANIFEST_FILENAME = "component.json";

struct DiscoveredComponent
{
    ComponentDescriptor descriptor;
    std::filesystem::path directory;
    std::filesystem::path manifest; ///< Empty when the descriptor was inferred from a library.
};

struct CONDUIT_RUNTIME_EXPORT DiscoveryReport
{
    std::vector<DiscoveredComponent> components;
    std::vector<ComponentError> errors;

    bool ok() const noexcept { return errors.empty(); }

    /// The descriptors of every discovered component, in discovery order.
    std::vector<ComponentDescriptor> descriptors() const;
};

class CONDUIT_RUNTIME_EXPORT ComponentDiscovery
{
  public:
    explicit ComponentDiscovery(std::vector<std::filesystem::path> roots);

    /// Scans "components.module_root".
    static ComponentDiscovery from_config(const utils::RuntimeConfig &config);

    const std::vector<std::filesystem::path> &roots() const noexcept { return m_roots; }

    /// Scans every root. A missing root is logged and skipped.
    DiscoveryReport discover() const;

    /**
     * @brief Builds a descriptor from a parsed manifest.
     * @param directory_name Id used when the manifest has none; a manifest id must match it.
     * @throws std::invalid_argument for a malformed manifest or an invalid id.
     */
    static ComponentDescriptor parse_manifest(const nlohmann::json &manifest,
                                              std::string_view directory_name);

    /**
     * @brief Reads and parses a manifest file.
     * @throws std::runtime_error if the file cannot be opened or is not valid JSON.
     * @throws std::invalid_argument as parse_manifest().
     */
    static ComponentDescriptor read_manifest(const std::filesystem::path &file,
                                             std::string_view directory_name);

  private:
    std::vector<std::filesystem::path> m_roots;
};

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
