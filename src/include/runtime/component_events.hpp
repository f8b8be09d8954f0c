#pragma once
/**
 * @file component_events.hpp
 * @brief Lifecycle notifications for components.
 *
 * The lifecycle manager reports every state change of a component as a StateChanged
 * event, followed by a more specific event when the change is one subscribers usually
 * care about (Loaded, Started, Stopped, Unloaded, Failed). A completed hot reload adds
 * Reloaded.
 *
 * Events are delivered synchronously on the thread running the lifecycle operation,
 * after the manager has released its state lock. A subscriber may query the manager
 * and the registry, but must not call start_all(), stop_all(), hot_reload() or remove():
 * those wait for the operation that is delivering the event. An exception thrown by a
 * subscriber is logged and does not reach the other subscribers or the operation.
 */
#include "conduit_runtime_export.h"
#include "runtime/component_descriptor.hpp"
#include "runtime/runtime_errors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::runtime
{

enum class ComponentEventType : int
{
    StateChanged = 0,
    Loaded,   ///< The loader produced an instance.
    Started,  ///< The component is Running and its behaviors are published.
    Stopped,  ///< on_detach() returned and the instance was released.
    Unloaded, ///< The component left the Stopped state for good or for a reload.
    Reloaded, ///< A hot reload finished with the component Running again.
    Failed    ///< The component moved to Failed; the event carries the error.
};

CONDUIT_RUNTIME_EXPORT const char *to_string(ComponentEventType type) noexcept;

struct CONDUIT_RUNTIME_EXPORT ComponentEvent
{
    ComponentEventType type{ComponentEventType::StateChanged};
    std::string component_id;
    ComponentState from{ComponentState::Registered};
    ComponentState to{ComponentState::Registered};
    std::optional<ComponentError> error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    /// "Started 'greeter' (Starting -> Running)"
    std::string to_string() const;
};

class CONDUIT_RUNTIME_EXPORT ComponentEventDispatcher
{
  public:
    using EventCallback = std::function<void(const ComponentEvent &event)>;
    using SubscriptionId = uint64_t;

    /**
     * @brief Adds a subscriber.
     * @param types Event types to deliver; empty delivers every type.
     * @throws std::invalid_argument if @p callback is empty.
     */
    SubscriptionId subscribe(EventCallback callback, std::set<ComponentEventType> types = {});

    /// @return false if @p id is not subscribed.
    bool unsubscribe(SubscriptionId id);

    size_t subscriber_count() const;

    /// Delivers @p event to every matching subscriber, in subscription order.
    void dispatch(const ComponentEvent &event) const;

  private:
    struct Subscription
    {
        SubscriptionId id{0};
        std::set<ComponentEventType> types;
        EventCallback callback;
    };

    mutable std::mutex m_mutex;
    std::vector<Subscription> m_subscriptions;
    SubscriptionId m_next_id{1};
};

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
