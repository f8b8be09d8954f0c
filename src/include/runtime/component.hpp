#pragma once
/**
 * @file component.hpp
 * @brief The contract between the runtime and a pluggable component.
 *
 * The lifecycle manager drives a component through:
 *   on_attach()            while Initializing   (throw to fail the start)
 *   contribute_behaviors() while Starting       (throw to fail the start)
 *   on_detach()            while Stopping       (bounded by the detach timeout)
 *
 * A component packaged as a shared library exports its entry points with
 * CONDUIT_EXPORT_COMPONENT(Type).
 */
#include "conduit_runtime_export.h"
#include "runtime/behavior.hpp"
#include "runtime/component_descriptor.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace conduit::runtime
{

class ComponentRegistry;
class LoadBoundary;

/// Bumped whenever the Component vtable or the entry point signatures change.
inline constexpr uint32_t kComponentAbiVersion = 1;

/**
 * @brief What a component sees of the runtime while it attaches.
 *
 * The registry holds the components that are already Running, which includes every
 * required dependency of the attaching component.
 */
class CONDUIT_RUNTIME_EXPORT ComponentContext
{
  public:
    ComponentContext(std::string component_id, const ComponentRegistry &registry,
                     const LoadBoundary &boundary)
        : m_component_id(std::move(component_id)), m_registry(registry), m_boundary(boundary)
    {
    }

    const std::string &component_id() const noexcept { return m_component_id; }
    const ComponentRegistry &registry() const noexcept { return m_registry; }
    const LoadBoundary &boundary() const noexcept { return m_boundary; }

  private:
    std::string m_component_id;
    const ComponentRegistry &m_registry;
    const LoadBoundary &m_boundary;
};

class CONDUIT_RUNTIME_EXPORT Component
{
  public:
    virtual ~Component() = default;

    virtual const ComponentDescriptor &descriptor() const = 0;

    virtual void on_attach(ComponentContext &ctx) = 0;
    virtual std::vector<BehaviorContribution> contribute_behaviors() = 0;
    virtual void on_detach() = 0;

    const std::string &id() const { return descriptor().id; }
};

/**
 * @brief Component with a fixed descriptor and no-op hooks.
 */
class CONDUIT_RUNTIME_EXPORT BasicComponent : public Component
{
  public:
    explicit BasicComponent(ComponentDescriptor descriptor) : m_descriptor(std::move(descriptor)) {}

    const ComponentDescriptor &descriptor() const override { return m_descriptor; }
    void on_attach(ComponentContext &) override {}
    std::vector<BehaviorContribution> contribute_behaviors() override { return {}; }
    void on_detach() override {}

  protected:
    ComponentDescriptor m_descriptor;
};

} // namespace conduit::runtime

// ---------------- shared-library entry points --------------

#if defined(_WIN32)
#define CONDUIT_COMPONENT_API extern "C" __declspec(dllexport)
#else
#define CONDUIT_COMPONENT_API extern "C" __attribute__((visibility("default")))
#endif

#define CONDUIT_COMPONENT_ABI_SYMBOL "conduit_component_abi_version"
#define CONDUIT_COMPONENT_CREATE_SYMBOL "conduit_create_component"
#define CONDUIT_COMPONENT_DESTROY_SYMBOL "conduit_destroy_component"

/**
 * @brief Exports the entry points for a default-constructible component `Type`.
 */
#define CONDUIT_EXPORT_COMPONENT(Type)                                                             \
    CONDUIT_COMPONENT_API uint32_t conduit_component_abi_version()                                 \
    {                                                                                              \
        return ::conduit::runtime::kComponentAbiVersion;                                           \
    }                                                                                              \
    CONDUIT_COMPONENT_API ::conduit::runtime::Component *conduit_create_component()                \
    {                                                                                              \
        return new Type();                                                                         \
    }                                                                                              \
    CONDUIT_COMPONENT_API void conduit_destroy_component(::conduit::runtime::Component *component) \
    {                                                                                              \
        delete component;                                                                          \
    }
