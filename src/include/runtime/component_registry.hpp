#pragma once
/**
 * @file component_registry.hpp
 * @brief Id -> (running instance, descriptor) map shared by running components.
 *
 * Owned by the LifecycleManager and handed to components through their
 * ComponentContext; there is no process-global registry. All members are safe for
 * concurrent callers. Registration is register-if-absent: an existing entry is never
 * overwritten or partially modified.
 */
#include "conduit_runtime_export.h"
#include "runtime/component.hpp"
#include "runtime/component_descriptor.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::runtime
{

class CONDUIT_RUNTIME_EXPORT ComponentRegistry
{
  public:
    ComponentRegistry() = default;
    ComponentRegistry(const ComponentRegistry &) = delete;
    ComponentRegistry &operator=(const ComponentRegistry &) = delete;

    /**
     * @brief Stores @p instance and @p descriptor under @p id if no entry exists.
     * @return false if @p id is already registered; the existing entry is untouched.
     * @throws std::invalid_argument if @p id is invalid or @p instance is null.
     */
    bool register_component(const std::string &id, std::shared_ptr<Component> instance,
                            ComponentDescriptor descriptor);

    std::shared_ptr<Component> get(std::string_view id) const;

    /// The instance downcast to T; nullptr when absent or of another type.
    template <typename T> std::shared_ptr<T> get_as(std::string_view id) const
    {
        return std::dynamic_pointer_cast<T>(get(id));
    }

    std::optional<ComponentDescriptor> get_descriptor(std::string_view id) const;
    bool is_registered(std::string_view id) const;

    /// Snapshot sorted by id.
    std::vector<ComponentDescriptor> all_descriptors() const;

    /// No-op when absent. @return true if an entry was removed.
    bool unregister(std::string_view id);

    /**
     * @brief Edits the stored descriptor under the write lock.
     * @details The id field is restored after @p mutator runs.
     * @return false if @p id is not registered.
     */
    bool update_descriptor(std::string_view id,
                           const std::function<void(ComponentDescriptor &)> &mutator);

    std::vector<std::string> ids_in_state(ComponentState state) const;
    std::vector<std::string> ids() const;
    size_t size() const;

  private:
    struct Entry
    {
        std::shared_ptr<Component> instance;
        ComponentDescriptor descriptor;
    };

    mutable std::shared_mutex m_mutex;
    std::map<std::string, Entry, std::less<>> m_entries;
};

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
