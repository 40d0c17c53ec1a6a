// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file globals.cpp
 * @brief Definitions of process-wide ux8 globals.
 * @details
 *   - g_platform is set by the entry point (or a test harness) before any subsystem runs.
 */

#include "ux8.hpp"

namespace ux8 {

// Global platform pointer (set by platform init, used everywhere)
hal::Platform* g_platform = nullptr;

} // namespace ux8
