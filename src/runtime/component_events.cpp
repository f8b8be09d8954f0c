/**
 * @file component_events.cpp
 * @brief Subscriber list and synchronous delivery of component lifecycle events.
 */
#include "cdt_service.hpp"
#include "runtime/component_events.hpp"

#include <algorithm>
#include <stdexcept>

namespace conduit::runtime
{

const char *to_string(ComponentEventType type) noexcept
{
    switch (type)
    {
    case ComponentEventType::StateChanged:
        return "StateChanged";
    case ComponentEventType::Loaded:
        return "Loaded";
    case ComponentEventType::Started:
        return "Started";
    case ComponentEventType::Stopped:
        return "Stopped";
    case ComponentEventType::Unloaded:
        return "Unloaded";
    case ComponentEventType::Reloaded:
        return "Reloaded";
    case ComponentEventType::Failed:
        return "Failed";
    default:
        return "Unknown";
    }
}

std::string ComponentEvent::to_string() const
{
    std::string out = fmt::format("{} '{}' ({} -> {})", runtime::to_string(type), component_id,
                                  runtime::to_string(from), runtime::to_string(to));
    if (error)
    {
        out += fmt::format(": {}", error->to_string());
    }
    return out;
}

ComponentEventDispatcher::SubscriptionId
ComponentEventDispatcher::subscribe(EventCallback callback, std::set<ComponentEventType> types)
{
    if (!callback)
    {
        throw std::invalid_argument("ComponentEventDispatcher: callback must not be empty.");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto id = m_next_id++;
    m_subscriptions.push_back(Subscription{id, std::move(types), std::move(callback)});
    return id;
}

bool ComponentEventDispatcher::unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_subscriptions.begin(), m_subscriptions.end(),
                           [id](const Subscription &s) { return s.id == id; });
    if (it == m_subscriptions.end())
    {
        return false;
    }
    m_subscriptions.erase(it);
    return true;
}

size_t ComponentEventDispatcher::subscriber_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscriptions.size();
}

void ComponentEventDispatcher::dispatch(const ComponentEvent &event) const
{
    // Delivered from a copy so a subscriber may unsubscribe itself.
    std::vector<Subscription> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &s : m_subscriptions)
        {
            if (s.types.empty() || s.types.count(event.type) != 0)
            {
                targets.push_back(s);
            }
        }
    }
    for (const auto &s : targets)
    {
        try
        {
            s.callback(event);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("ComponentEventDispatcher: subscriber #{} threw on {}: {}", s.id,
                         event.to_string(), e.what());
        }
        catch (...)
        {
            LOGGER_ERROR("ComponentEventDispatcher: subscriber #{} threw a non-standard "
                         "exception on {}.",
                         s.id, event.to_string());
        }
    }
}

} // namespace conduit::runtime
