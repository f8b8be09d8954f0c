// tests/test_layer2_service/test_service_lifecycle.cpp
/**
 * @file test_service_lifecycle.cpp
 * @brief Tests for ServiceLifecycle, ModuleDef and LifecycleGuard.
 *
 * Scenarios that touch the process-wide lifecycle run in workers; ModuleDef argument
 * validation is tested in-process.
 */
#include "cdt_service.hpp"
#include "test_entrypoint.h"
#include "test_patterns.h"
#include "test_process_utils.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <stdexcept>
#include <string>

using namespace conduit::tests;
using namespace conduit::tests::helper;
using ::testing::HasSubstr;

class ServiceLifecycleTest : public IsolatedProcessTest
{
  protected:
    /// Runs a scenario that is expected to abort and returns its stderr.
    std::string RunAbortingWorker(const std::string &scenario)
    {
        auto proc = SpawnWorker(scenario);
        EXPECT_TRUE(proc->valid());
        EXPECT_NE(proc->wait_for_exit(), 0);
        return proc->get_stderr();
    }
};

// A second guard is a no-op that warns and prints where it was constructed.
TEST_F(ServiceLifecycleTest, MultipleGuardsWarning)
{
    auto proc = SpawnWorker("lifecycle.test_multiple_guards_warning");
    ExpectWorkerOk(*proc, {"[STACK]"});
}

TEST_F(ServiceLifecycleTest, ServicesStartInDependencyOrder)
{
    auto proc = SpawnWorker("lifecycle.test_services_start_in_dependency_order");
    ExpectWorkerOk(*proc);
}

TEST_F(ServiceLifecycleTest, IsInitializedFlag)
{
    auto proc = SpawnWorker("lifecycle.test_is_initialized_flag");
    ExpectWorkerOk(*proc);
}

TEST_F(ServiceLifecycleTest, RegisterAfterInitAborts)
{
    EXPECT_THAT(RunAbortingWorker("lifecycle.test_register_after_init_aborts"),
                HasSubstr("register_module('LateService') called after initialize()"));
}

TEST_F(ServiceLifecycleTest, DuplicateRegistrationAborts)
{
    EXPECT_THAT(RunAbortingWorker("lifecycle.test_duplicate_registration_aborts"),
                HasSubstr("service 'Twice' registered twice"));
}

TEST_F(ServiceLifecycleTest, UnresolvedDependencyAborts)
{
    const auto err = RunAbortingWorker("lifecycle.test_unresolved_dependency_aborts");
    EXPECT_THAT(err, HasSubstr("FATAL"));
    EXPECT_THAT(err, HasSubstr("depends on unknown component 'Ghost'"));
}

TEST_F(ServiceLifecycleTest, CircularDependencyAborts)
{
    const auto err = RunAbortingWorker("lifecycle.test_circular_dependency_aborts");
    EXPECT_THAT(err, HasSubstr("FATAL"));
    EXPECT_THAT(err, HasSubstr("cyclic dependency"));
}

TEST_F(ServiceLifecycleTest, StartupExceptionAborts)
{
    const auto err = RunAbortingWorker("lifecycle.test_startup_exception_aborts");
    EXPECT_THAT(err, HasSubstr("Exception during startup: service refused"));
    EXPECT_THAT(err, HasSubstr("Exploding"));
}

TEST_F(ServiceLifecycleTest, InitIsIdempotent)
{
    auto proc = SpawnWorker("lifecycle.test_init_idempotency");
    ExpectWorkerOk(*proc);
}

TEST_F(ServiceLifecycleTest, FinalizeIsIdempotent)
{
    auto proc = SpawnWorker("lifecycle.test_finalize_idempotency");
    ExpectWorkerOk(*proc);
}

TEST_F(ServiceLifecycleTest, IsFinalizedFlag)
{
    auto proc = SpawnWorker("lifecycle.test_is_finalized_flag");
    ExpectWorkerOk(*proc);
}

// A shutdown callback that overruns its timeout is abandoned; the rest still run.
TEST_F(ServiceLifecycleTest, ShutdownTimeoutContinues)
{
    auto proc = SpawnWorker("lifecycle.test_shutdown_timeout_continues");
    ExpectWorkerOk(*proc);
}

TEST_F(ServiceLifecycleTest, ShutdownExceptionContinues)
{
    auto proc = SpawnWorker("lifecycle.test_shutdown_exception_continues");
    ExpectWorkerOk(*proc);
}

// ============================================================================
// ModuleDef validation (in-process)
// ============================================================================

TEST(ModuleDefTest, RejectsEmptyName)
{
    EXPECT_THROW(conduit::utils::ModuleDef(""), std::invalid_argument);
}

TEST(ModuleDefTest, RejectsOverlongName)
{
    const std::string name(conduit::utils::ModuleDef::MAX_MODULE_NAME_LEN + 1, 'x');
    EXPECT_THROW(conduit::utils::ModuleDef{name}, std::length_error);
}

TEST(ModuleDefTest, EmptyDependencyIsIgnored)
{
    conduit::utils::ModuleDef def("Service");
    EXPECT_NO_THROW(def.add_dependency(""));
    const std::string long_dep(conduit::utils::ModuleDef::MAX_MODULE_NAME_LEN + 1, 'd');
    EXPECT_THROW(def.add_dependency(long_dep), std::length_error);
}

TEST(ModuleDefTest, RejectsOverlongCallbackArgument)
{
    conduit::utils::ModuleDef def("Service");
    const std::string arg(conduit::utils::ModuleDef::MAX_CALLBACK_PARAM_STRLEN + 1, 'a');
    EXPECT_THROW(def.set_startup([](const char *) {}, arg), std::length_error);
}
