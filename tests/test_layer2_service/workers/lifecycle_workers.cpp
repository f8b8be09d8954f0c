// tests/test_layer2_service/workers/lifecycle_workers.cpp
/**
 * @file lifecycle_workers.cpp
 * @brief Worker functions for the ServiceLifecycle tests.
 *
 * Every scenario touches the process-wide lifecycle singleton, so each one runs in a
 * freshly spawned process.
 */
#include "lifecycle_workers.h"
#include "cdt_service.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "gtest/gtest.h"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace conduit::utils;
using namespace conduit::tests::helper;
using namespace std::chrono_literals;

namespace
{

std::mutex g_order_mutex;
std::vector<std::string> g_events;

void record_event(const char *arg)
{
    std::lock_guard<std::mutex> lock(g_order_mutex);
    g_events.emplace_back(arg != nullptr ? arg : "");
}

std::vector<std::string> events()
{
    std::lock_guard<std::mutex> lock(g_order_mutex);
    return g_events;
}

std::atomic<int> g_startups{0};
std::atomic<int> g_shutdowns{0};

void count_startup(const char *)
{
    g_startups.fetch_add(1);
}

void count_shutdown(const char *)
{
    g_shutdowns.fetch_add(1);
}

void slow_shutdown(const char *)
{
    std::this_thread::sleep_for(2s);
}

void throwing_callback(const char *)
{
    throw std::runtime_error("service refused");
}

ModuleDef make_recording_module(const std::string &name,
                                std::initializer_list<std::string_view> deps = {})
{
    ModuleDef def(name);
    for (auto d : deps)
        def.add_dependency(d);
    def.set_startup(&record_event, "start:" + name);
    def.set_shutdown(&record_event, 1000ms, "stop:" + name);
    return def;
}

} // namespace

namespace conduit::tests::worker::lifecycle
{

int test_multiple_guards_warning()
{
    return run_worker_bare(
        []()
        {
            LifecycleGuard owner(make_recording_module("first"));
            ASSERT_TRUE(owner.is_owner());
            {
                LifecycleGuard second(make_recording_module("ignored"));
                EXPECT_FALSE(second.is_owner());
            }
            // Modules of the non-owning guard are never started.
            const auto started = ServiceLifecycle::instance().started_modules();
            ASSERT_EQ(started.size(), 1u);
            EXPECT_EQ(started[0], "first");
        },
        "lifecycle::test_multiple_guards_warning");
}

int test_services_start_in_dependency_order()
{
    return run_worker_bare(
        []()
        {
            {
                // Registered out of order on purpose: C needs B, B needs A.
                LifecycleGuard guard(MakeModDefList(make_recording_module("C", {"B"}),
                                                    make_recording_module("A"),
                                                    make_recording_module("B", {"A"})));
                const auto started = ServiceLifecycle::instance().started_modules();
                ASSERT_EQ(started, (std::vector<std::string>{"A", "B", "C"}));
            }
            const std::vector<std::string> expected{"start:A", "start:B", "start:C",
                                                    "stop:C",  "stop:B",  "stop:A"};
            EXPECT_EQ(events(), expected);
        },
        "lifecycle::test_services_start_in_dependency_order");
}

int test_is_initialized_flag()
{
    return run_worker_bare(
        []()
        {
            ASSERT_FALSE(IsAppInitialized());
            {
                LifecycleGuard guard;
                ASSERT_TRUE(IsAppInitialized());
                ASSERT_FALSE(IsAppFinalized());
            }
            ASSERT_TRUE(IsAppFinalized());
        },
        "lifecycle::test_is_initialized_flag");
}

int test_register_after_init_aborts()
{
    return run_worker_bare(
        []()
        {
            LifecycleGuard guard;
            RegisterModule(ModuleDef("LateService"));
        },
        "lifecycle::test_register_after_init_aborts");
}

int test_duplicate_registration_aborts()
{
    return run_worker_bare(
        []()
        {
            RegisterModule(ModuleDef("Twice"));
            RegisterModule(ModuleDef("Twice"));
        },
        "lifecycle::test_duplicate_registration_aborts");
}

int test_unresolved_dependency_aborts()
{
    return run_worker_bare(
        []()
        {
            ModuleDef def("NeedsGhost");
            def.add_dependency("Ghost");
            LifecycleGuard guard(std::move(def));
        },
        "lifecycle::test_unresolved_dependency_aborts");
}

int test_circular_dependency_aborts()
{
    return run_worker_bare(
        []()
        {
            LifecycleGuard guard(MakeModDefList(make_recording_module("D", {"E"}),
                                                make_recording_module("E", {"D"})));
        },
        "lifecycle::test_circular_dependency_aborts");
}

int test_startup_exception_aborts()
{
    return run_worker_bare(
        []()
        {
            ModuleDef def("Exploding");
            def.set_startup(&throwing_callback);
            LifecycleGuard guard(std::move(def));
        },
        "lifecycle::test_startup_exception_aborts");
}

int test_init_idempotency()
{
    return run_worker_bare(
        []()
        {
            ModuleDef def("Counted");
            def.set_startup(&count_startup);
            RegisterModule(std::move(def));
            InitializeApp();
            InitializeApp();
            EXPECT_EQ(g_startups.load(), 1);
            FinalizeApp();
        },
        "lifecycle::test_init_idempotency");
}

int test_finalize_idempotency()
{
    return run_worker_bare(
        []()
        {
            ModuleDef def("Counted");
            def.set_shutdown(&count_shutdown, 1000ms);
            RegisterModule(std::move(def));
            InitializeApp();
            FinalizeApp();
            FinalizeApp();
            EXPECT_EQ(g_shutdowns.load(), 1);
            EXPECT_TRUE(ServiceLifecycle::instance().started_modules().empty());
        },
        "lifecycle::test_finalize_idempotency");
}

int test_is_finalized_flag()
{
    return run_worker_bare(
        []()
        {
            // Finalizing before initializing is a no-op.
            FinalizeApp();
            EXPECT_FALSE(IsAppFinalized());
            InitializeApp();
            EXPECT_FALSE(IsAppFinalized());
            FinalizeApp();
            EXPECT_TRUE(IsAppFinalized());
        },
        "lifecycle::test_is_finalized_flag");
}

int test_shutdown_timeout_continues()
{
    return run_worker_bare(
        []()
        {
            {
                ModuleDef slow("Slow");
                slow.add_dependency("Base");
                slow.set_shutdown(&slow_shutdown, 50ms);
                LifecycleGuard guard(
                    MakeModDefList(make_recording_module("Base"), std::move(slow)));
            }
            // The base service still shuts down after the slow one is abandoned.
            const auto ev = events();
            ASSERT_FALSE(ev.empty());
            EXPECT_EQ(ev.back(), "stop:Base");
        },
        "lifecycle::test_shutdown_timeout_continues");
}

int test_shutdown_exception_continues()
{
    return run_worker_bare(
        []()
        {
            {
                ModuleDef bad("Bad");
                bad.add_dependency("Base");
                bad.set_shutdown(&throwing_callback, 1000ms);
                LifecycleGuard guard(
                    MakeModDefList(make_recording_module("Base"), std::move(bad)));
            }
            const auto ev = events();
            ASSERT_FALSE(ev.empty());
            EXPECT_EQ(ev.back(), "stop:Base");
        },
        "lifecycle::test_shutdown_exception_continues");
}

} // namespace conduit::tests::worker::lifecycle

namespace
{
struct LifecycleWorkerRegistrar
{
    LifecycleWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "lifecycle")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace conduit::tests::worker::lifecycle;
                if (scenario == "test_multiple_guards_warning")
                    return test_multiple_guards_warning();
                if (scenario == "test_services_start_in_dependency_order")
                    return test_services_start_in_dependency_order();
                if (scenario == "test_is_initialized_flag")
                    return test_is_initialized_flag();
                if (scenario == "test_register_after_init_aborts")
                    return test_register_after_init_aborts();
                if (scenario == "test_duplicate_registration_aborts")
                    return test_duplicate_registration_aborts();
                if (scenario == "test_unresolved_dependency_aborts")
                    return test_unresolved_dependency_aborts();
                if (scenario == "test_circular_dependency_aborts")
                    return test_circular_dependency_aborts();
                if (scenario == "test_startup_exception_aborts")
                    return test_startup_exception_aborts();
                if (scenario == "test_init_idempotency")
                    return test_init_idempotency();
                if (scenario == "test_finalize_idempotency")
                    return test_finalize_idempotency();
                if (scenario == "test_is_finalized_flag")
                    return test_is_finalized_flag();
                if (scenario == "test_shutdown_timeout_continues")
                    return test_shutdown_timeout_continues();
                if (scenario == "test_shutdown_exception_continues")
                    return test_shutdown_exception_continues();
                fmt::print(stderr, "ERROR: Unknown lifecycle scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static LifecycleWorkerRegistrar g_lifecycle_registrar;
} // namespace
