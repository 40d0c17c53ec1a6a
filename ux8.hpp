// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file ux8.hpp
 * @brief Main internal header for ux8 v0.1.
 * @details
 * Includes the core and HAL headers, declares the process-wide platform pointer and the
 * shell entry point. This file is used by the subsystems themselves.
 *
 * @version 0.1
 * @see ux8.cpp, main.cpp
 */
#ifndef UX8_HPP
#define UX8_HPP

#include "core.hpp" // Defines ux8::core constants
#include "hal.hpp"  // Defines ux8::hal interfaces

namespace ux8 {
    // Global variables (defined in globals.cpp)
    extern hal::Platform* g_platform;

    inline constexpr const char* VERSION_STRING = "0.1";

    /// Runtime options chosen on the command line.
    struct BootOptions {
        uint8_t ticks_per_second = core::DEFAULT_TICKS_PER_SEC;
        bool trace = false;
    };

    /**
     * @brief Brings up every subsystem on g_platform and runs the shell until EXIT.
     * @return Process exit status.
     */
    int shell_main(const BootOptions& options);
} // namespace ux8

#endif // UX8_HPP
