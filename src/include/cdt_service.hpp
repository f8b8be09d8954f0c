#pragma once
/**
 * @file cdt_service.hpp
 * @brief Layer 2: Service modules built on cdt_base.
 *
 * Provides the service lifecycle (LifecycleGuard), the asynchronous Logger and the
 * process-wide RuntimeConfig.
 */
#include "cdt_base.hpp"

#include "utils/service_lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"
