/**
 * @file test_component_registry.cpp
 * @brief ComponentRegistry: register-if-absent semantics, lookups and concurrency.
 */
#include "cdt_runtime.hpp"
#include "runtime_test_doubles.h"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <atomic>

using namespace conduit::runtime;
using conduit::tests::PureApiTest;
using conduit::tests::helper::make_descriptor;
using conduit::tests::helper::ThreadRacer;

namespace
{
class Greeter : public BasicComponent
{
  public:
    explicit Greeter(const std::string &id) : BasicComponent(make_descriptor(id)) {}
    std::string greet() const { return "hello from " + id(); }
};

std::shared_ptr<Component> make_plain(const std::string &id)
{
    return std::make_shared<BasicComponent>(make_descriptor(id));
}
} // namespace

class ComponentRegistryTest : public PureApiTest
{
  protected:
    ComponentRegistry registry_;
};

TEST_F(ComponentRegistryTest, RegisterAndGet)
{
    auto instance = std::make_shared<Greeter>("greeter");
    ASSERT_TRUE(registry_.register_component("greeter", instance, make_descriptor("greeter")));
    EXPECT_TRUE(registry_.is_registered("greeter"));
    EXPECT_EQ(registry_.get("greeter"), instance);
    EXPECT_EQ(registry_.size(), 1u);

    auto typed = registry_.get_as<Greeter>("greeter");
    ASSERT_NE(typed, nullptr);
    EXPECT_EQ(typed->greet(), "hello from greeter");
}

TEST_F(ComponentRegistryTest, MissingIdYieldsNothing)
{
    EXPECT_EQ(registry_.get("nobody"), nullptr);
    EXPECT_EQ(registry_.get_as<Greeter>("nobody"), nullptr);
    EXPECT_FALSE(registry_.get_descriptor("nobody").has_value());
    EXPECT_FALSE(registry_.unregister("nobody"));
}

TEST_F(ComponentRegistryTest, GetAsWrongTypeIsNull)
{
    registry_.register_component("plain", make_plain("plain"), make_descriptor("plain"));
    EXPECT_EQ(registry_.get_as<Greeter>("plain"), nullptr);
}

// An existing entry is never replaced.
TEST_F(ComponentRegistryTest, DuplicateRegistrationLeavesOriginal)
{
    auto first = make_plain("svc");
    auto second = make_plain("svc");
    auto desc = make_descriptor("svc");
    desc.version = "1.0.0";
    ASSERT_TRUE(registry_.register_component("svc", first, desc));

    desc.version = "2.0.0";
    EXPECT_FALSE(registry_.register_component("svc", second, desc));
    EXPECT_EQ(registry_.get("svc"), first);
    EXPECT_EQ(registry_.get_descriptor("svc")->version, "1.0.0");
}

TEST_F(ComponentRegistryTest, RejectsInvalidInput)
{
    EXPECT_THROW(registry_.register_component("", make_plain("x"), make_descriptor("x")),
                 std::invalid_argument);
    EXPECT_THROW(registry_.register_component("has space", make_plain("x"), make_descriptor("x")),
                 std::invalid_argument);
    EXPECT_THROW(registry_.register_component("x", nullptr, make_descriptor("x")),
                 std::invalid_argument);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(ComponentRegistryTest, UpdateDescriptorKeepsId)
{
    registry_.register_component("svc", make_plain("svc"), make_descriptor("svc"));
    EXPECT_TRUE(registry_.update_descriptor("svc",
                                            [](ComponentDescriptor &d)
                                            {
                                                d.state = ComponentState::Running;
                                                d.id = "renamed";
                                                d.metadata["owner"] = "ops";
                                            }));
    const auto desc = registry_.get_descriptor("svc");
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->id, "svc");
    EXPECT_EQ(desc->state, ComponentState::Running);
    EXPECT_EQ(desc->metadata.at("owner"), "ops");
    EXPECT_FALSE(registry_.update_descriptor("ghost", [](ComponentDescriptor &) {}));
}

TEST_F(ComponentRegistryTest, QueriesAreSorted)
{
    for (const char *id : {"c", "a", "b"})
    {
        auto desc = make_descriptor(id);
        desc.state = std::string(id) == "b" ? ComponentState::Failed : ComponentState::Running;
        registry_.register_component(id, make_plain(id), desc);
    }
    EXPECT_EQ(registry_.ids(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(registry_.ids_in_state(ComponentState::Running),
              (std::vector<std::string>{"a", "c"}));
    const auto all = registry_.all_descriptors();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all.front().id, "a");
    EXPECT_EQ(all.back().id, "c");
}

TEST_F(ComponentRegistryTest, Unregister)
{
    registry_.register_component("svc", make_plain("svc"), make_descriptor("svc"));
    EXPECT_TRUE(registry_.unregister("svc"));
    EXPECT_FALSE(registry_.is_registered("svc"));
    // The id can be registered again afterwards.
    EXPECT_TRUE(registry_.register_component("svc", make_plain("svc"), make_descriptor("svc")));
}

// Many threads racing to register one id: exactly one wins.
TEST_F(ComponentRegistryTest, ConcurrentRegistrationHasOneWinner)
{
    const int kThreads = conduit::tests::helper::scaled_value(16, 4);
    std::atomic<int> winners{0};
    ThreadRacer racer(kThreads);
    ASSERT_TRUE(racer.race(
        [&](int)
        {
            if (registry_.register_component("contested", make_plain("contested"),
                                             make_descriptor("contested")))
            {
                winners.fetch_add(1);
            }
        }));
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(ComponentRegistryTest, ConcurrentReadersAndWriters)
{
    const int kThreads = 8;
    const int kRounds = conduit::tests::helper::scaled_value(500, 50);
    ThreadRacer racer(kThreads);
    ASSERT_TRUE(racer.race(
        [&](int t)
        {
            const std::string id = "c" + std::to_string(t);
            for (int i = 0; i < kRounds; ++i)
            {
                if (t % 2 == 0)
                {
                    registry_.register_component(id, make_plain(id), make_descriptor(id));
                    registry_.unregister(id);
                }
                else
                {
                    (void)registry_.all_descriptors();
                    (void)registry_.get("c0");
                }
            }
        }));
    EXPECT_EQ(registry_.size(), 0u);
}
