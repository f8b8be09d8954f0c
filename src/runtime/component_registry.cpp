/**
 * @file component_registry.cpp
 * @brief Thread-safe map of running component instances and their descriptors.
 */
#include "cdt_service.hpp"
#include "runtime/component_registry.hpp"

#include <mutex>
#include <stdexcept>

namespace conduit::runtime
{

bool ComponentRegistry::register_component(const std::string &id,
                                           std::shared_ptr<Component> instance,
                                           ComponentDescriptor descriptor)
{
    validate_component_id(id);
    if (!instance)
    {
        throw std::invalid_argument(
            fmt::format("ComponentRegistry: instance for '{}' must not be null.", id));
    }
    descriptor.id = id;

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    const auto [it, inserted] = m_entries.try_emplace(id, Entry{std::move(instance), std::move(descriptor)});
    if (!inserted)
    {
        lock.unlock();
        LOGGER_WARN("ComponentRegistry: DuplicateRegistration('{}') rejected.", id);
        return false;
    }
    LOGGER_DEBUG("ComponentRegistry: registered '{}'.", id);
    return true;
}

std::shared_ptr<Component> ComponentRegistry::get(std::string_view id) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    return it == m_entries.end() ? nullptr : it->second.instance;
}

std::optional<ComponentDescriptor> ComponentRegistry::get_descriptor(std::string_view id) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end())
    {
        return std::nullopt;
    }
    return it->second.descriptor;
}

bool ComponentRegistry::is_registered(std::string_view id) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.find(id) != m_entries.end();
}

std::vector<ComponentDescriptor> ComponentRegistry::all_descriptors() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<ComponentDescriptor> out;
    out.reserve(m_entries.size());
    for (const auto &[id, entry] : m_entries)
    {
        out.push_back(entry.descriptor);
    }
    return out;
}

bool ComponentRegistry::unregister(std::string_view id)
{
    std::shared_ptr<Component> released;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end())
        {
            return false;
        }
        // Dropped outside the lock in case this is the last reference.
        released = std::move(it->second.instance);
        m_entries.erase(it);
    }
    LOGGER_DEBUG("ComponentRegistry: unregistered '{}'.", id);
    return true;
}

bool ComponentRegistry::update_descriptor(std::string_view id,
                                          const std::function<void(ComponentDescriptor &)> &mutator)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end())
    {
        return false;
    }
    mutator(it->second.descriptor);
    it->second.descriptor.id = it->first;
    return true;
}

std::vector<std::string> ComponentRegistry::ids_in_state(ComponentState state) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> out;
    for (const auto &[id, entry] : m_entries)
    {
        if (entry.descriptor.state == state)
        {
            out.push_back(id);
        }
    }
    return out;
}

std::vector<std::string> ComponentRegistry::ids() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> out;
    out.reserve(m_entries.size());
    for (const auto &[id, entry] : m_entries)
    {
        out.push_back(id);
    }
    return out;
}

size_t ComponentRegistry::size() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace conduit::runtime
