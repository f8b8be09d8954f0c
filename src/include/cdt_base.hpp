#pragma once
/**
 * @file cdt_base.hpp
 * @brief Layer 1: Basic modules built on cdt_platform.
 *
 * Provides format_tools, debug_info, Result<T,E>, the timed call helper and module_def
 * for service registration. Include this when you need formatting, debug utilities or
 * error plumbing but no services.
 */
#include "cdt_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/result.hpp"
#include "utils/timed_call.hpp"
#include "utils/module_def.hpp"
