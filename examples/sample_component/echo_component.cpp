/**
 * @file echo_component.cpp
 * @brief Example: a component packaged as a shared library.
 *
 * Built as the `conduit_echo_component` module. Load it with a DynamicLibraryLoader whose
 * search directories include the build output directory, or place the library in the
 * component's private directory (`<module_root>/echo/`).
 *
 * The component contributes one behavior, "echo.reply", which answers any string input
 * with "echo: <input>" and short-circuits the rest of the chain.
 */
#include "cdt_runtime.hpp"

#include <any>
#include <string>

namespace
{

using namespace conduit::runtime;

class EchoComponent : public Component
{
  public:
    EchoComponent()
    {
        m_descriptor.id = "echo";
        m_descriptor.name = "Echo";
        m_descriptor.version = "1.2.0";
        m_descriptor.description = "Replies to string requests with their own text.";
    }

    const ComponentDescriptor &descriptor() const override { return m_descriptor; }

    void on_attach(ComponentContext &ctx) override
    {
        LOGGER_INFO("echo: attached as '{}' (boundary #{}).", ctx.component_id(),
                    ctx.boundary().instance_id());
    }

    std::vector<BehaviorContribution> contribute_behaviors() override
    {
        auto reply = make_behavior(
            [](PipelineContext &ctx, const Behavior::Next &next) -> std::any
            {
                const auto *text = ctx.input_as<std::string>();
                if (text == nullptr)
                {
                    return next(ctx);
                }
                ctx.set_property("echo.handled", true);
                return std::string("echo: ") + *text;
            });
        return {BehaviorContributionBuilder("echo.reply")
                    .with_name("Echo reply")
                    .with_behavior(std::move(reply))
                    .with_priority(500)
                    .with_tag("example")
                    .build()};
    }

    void on_detach() override { LOGGER_INFO("echo: detached."); }

  private:
    ComponentDescriptor m_descriptor;
};

} // namespace

CONDUIT_EXPORT_COMPONENT(EchoComponent)
