// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal.cpp
 * @brief Hardware abstraction layer entry point for ux8 v0.1.
 */

#include "hal.hpp"
#include "hal/hal_host.hpp"

namespace ux8 {
namespace hal {

static ::hal::host::PlatformHost g_platform_instance;
Platform* get_platform() { return &g_platform_instance; }

} // namespace hal
} // namespace ux8
