/**
 * @file component_discovery.cpp
 * @brief Directory scan producing ComponentDescriptors from manifests or library files.
 */
#include "cdt_service.hpp"
#include "cdt_platform.hpp"
#include "runtime/component_discovery.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace conduit::runtime
{

namespace fs = std::filesystem;

namespace
{

template <typename T> T read_field(const nlohmann::json &manifest, const char *key)
{
    try
    {
        return manifest.at(key).get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::invalid_argument(
            fmt::format("component manifest: '{}' has the wrong type: {}", key, e.what()));
    }
}

std::set<std::string> read_name_set(const nlohmann::json &section, const char *key)
{
    if (!section.contains(key))
    {
        return {};
    }
    const auto names = read_field<std::vector<std::string>>(section, key);
    return {names.begin(), names.end()};
}

IsolationLevel parse_level(const std::string &text)
{
    if (text == "none")
        return IsolationLevel::None;
    if (text == "standard")
        return IsolationLevel::Standard;
    if (text == "strict")
        return IsolationLevel::Strict;
    throw std::invalid_argument(fmt::format(
        "component manifest: unknown isolation level '{}' (expected none, standard or strict)",
        text));
}

ComponentError discovery_error(const std::string &id, std::string message)
{
    return ComponentError::make(id, RuntimeErrorCode::DiscoveryFailure, std::move(message),
                                ErrorSeverity::Error);
}

} // namespace

std::vector<ComponentDescriptor> DiscoveryReport::descriptors() const
{
    std::vector<ComponentDescriptor> out;
    out.reserve(components.size());
    for (const auto &c : components)
    {
        out.push_back(c.descriptor);
    }
    return out;
}

ComponentDiscovery::ComponentDiscovery(std::vector<fs::path> roots) : m_roots(std::move(roots)) {}

ComponentDiscovery ComponentDiscovery::from_config(const utils::RuntimeConfig &config)
{
    return ComponentDiscovery({config.module_root()});
}

ComponentDescriptor ComponentDiscovery::parse_manifest(const nlohmann::json &manifest,
                                                       std::string_view directory_name)
{
    if (!manifest.is_object())
    {
        throw std::invalid_argument("component manifest: top-level JSON value must be an object");
    }

    ComponentDescriptor d;
    d.id = manifest.contains("id") ? read_field<std::string>(manifest, "id")
                                   : std::string(directory_name);
    validate_component_id(d.id);
    if (d.id != directory_name)
    {
        throw std::invalid_argument(fmt::format(
            "component manifest: id '{}' does not match its directory '{}'", d.id, directory_name));
    }

    d.name = manifest.contains("name") ? read_field<std::string>(manifest, "name") : d.id;
    if (manifest.contains("version"))
        d.version = read_field<std::string>(manifest, "version");
    if (manifest.contains("description"))
        d.description = read_field<std::string>(manifest, "description");
    d.dependencies = read_name_set(manifest, "dependencies");
    d.optional_dependencies = read_name_set(manifest, "optional_dependencies");
    if (manifest.contains("entry_module"))
        d.entry_module = read_field<std::string>(manifest, "entry_module");
    if (manifest.contains("imports"))
        d.imports = read_field<std::vector<std::string>>(manifest, "imports");
    if (manifest.contains("metadata"))
        d.metadata = read_field<std::map<std::string, std::string>>(manifest, "metadata");

    if (manifest.contains("isolation"))
    {
        const auto &iso = manifest.at("isolation");
        if (!iso.is_object())
        {
            throw std::invalid_argument("component manifest: 'isolation' must be an object");
        }
        if (iso.contains("level"))
            d.isolation.level = parse_level(read_field<std::string>(iso, "level"));
        d.isolation.allowed_modules = read_name_set(iso, "allowed_modules");
        d.isolation.blocked_modules = read_name_set(iso, "blocked_modules");
    }

    for (const auto &dep : d.dependencies)
    {
        validate_component_id(dep);
    }
    for (const auto &dep : d.optional_dependencies)
    {
        validate_component_id(dep);
    }
    return d;
}

ComponentDescriptor ComponentDiscovery::read_manifest(const fs::path &file,
                                                      std::string_view directory_name)
{
    std::ifstream f(file);
    if (!f.is_open())
    {
        throw std::runtime_error(fmt::format("cannot open manifest '{}'", file.string()));
    }
    nlohmann::json j;
    try
    {
        f >> j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error(fmt::format("cannot parse '{}': {}", file.string(), e.what()));
    }
    return parse_manifest(j, directory_name);
}

DiscoveryReport ComponentDiscovery::discover() const
{
    DiscoveryReport report;
    std::set<std::string> seen;

    for (const auto &root : m_roots)
    {
        std::error_code ec;
        if (!fs::is_directory(root, ec))
        {
            LOGGER_WARN("ComponentDiscovery: plugin directory '{}' does not exist.", root.string());
            continue;
        }
        LOGGER_INFO("ComponentDiscovery: scanning '{}'.", root.string());

        std::vector<fs::path> candidates;
        for (const auto &entry : fs::directory_iterator(root, ec))
        {
            std::error_code type_ec;
            if (entry.is_directory(type_ec))
            {
                candidates.push_back(entry.path());
            }
        }
        if (ec)
        {
            report.errors.push_back(discovery_error(
                root.filename().string(),
                fmt::format("cannot list '{}': {}", root.string(), ec.message())));
            continue;
        }
        std::sort(candidates.begin(), candidates.end());

        for (const auto &dir : candidates)
        {
            const auto name = dir.filename().string();
            const auto manifest = dir / COMPONENT_MANIFEST_FILENAME;
            const auto library = dir / platform::shared_library_filename(name);

            DiscoveredComponent found;
            found.directory = dir;
            std::error_code file_ec;
            try
            {
                if (fs::is_regular_file(manifest, file_ec))
                {
                    found.descriptor = read_manifest(manifest, name);
                    found.manifest = manifest;
                }
                else if (fs::is_regular_file(library, file_ec))
                {
                    validate_component_id(name);
                    found.descriptor.id = name;
                    found.descriptor.name = name;
                    found.descriptor.entry_module = name;
                }
                else
                {
                    LOGGER_DEBUG("ComponentDiscovery: '{}' holds no component.", dir.string());
                    continue;
                }
            }
            catch (const std::exception &e)
            {
                report.errors.push_back(discovery_error(name, e.what()));
                continue;
            }

            if (!seen.insert(found.descriptor.id).second)
            {
                report.errors.push_back(ComponentError::make(
                    found.descriptor.id, RuntimeErrorCode::DuplicateComponentId,
                    fmt::format("'{}' was already discovered under an earlier root",
                                dir.string()),
                    ErrorSeverity::Warning));
                continue;
            }
            LOGGER_INFO("ComponentDiscovery: found '{}' v{} ({}).", found.descriptor.id,
                        found.descriptor.version,
                        found.manifest.empty() ? "library" : "manifest");
            report.components.push_back(std::move(found));
        }
    }

    for (const auto &error : report.errors)
    {
        LOGGER_WARN("ComponentDiscovery: {}", error.to_string());
    }
    return report;
}

} // namespace conduit::runtime
