#pragma once
/**
 * @file cdt_runtime.hpp
 * @brief Layer 3: The component runtime.
 *
 * Dependency resolution, isolation boundaries and loaders, the component registry,
 * the lifecycle manager and the behavior chain engine.
 */
#include "cdt_service.hpp"

#include "runtime/runtime_errors.hpp"
#include "runtime/component_descriptor.hpp"
#include "runtime/dependency_graph.hpp"
#include "runtime/dynamic_library.hpp"
#include "runtime/isolation_boundary.hpp"
#include "runtime/module_loader.hpp"
#include "runtime/pipeline_context.hpp"
#include "runtime/behavior.hpp"
#include "runtime/behavior_chain.hpp"
#include "runtime/behavior_chain_engine.hpp"
#include "runtime/component.hpp"
#include "runtime/component_registry.hpp"
#include "runtime/component_events.hpp"
#include "runtime/lifecycle_manager.hpp"
#include "runtime/component_discovery.hpp"
