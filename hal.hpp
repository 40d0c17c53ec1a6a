// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal.hpp
 * @brief Hardware Abstraction Layer (HAL) interfaces for ux8 v0.1.
 * @details
 * Defines HAL interfaces for the only hardware the shell touches: a character console,
 * a free-running 24-bit tick counter and the interrupt line that advances it.
 *
 * @version 0.1
 * @see hal.cpp, core.hpp
 */

#ifndef HAL_HPP
#define HAL_HPP

#include "core.hpp"
#include <cstdint>
#include <cstddef>

namespace ux8 {
namespace hal {

struct UARTDriverOps {
    virtual ~UARTDriverOps() = default;
    virtual void putc(char c) = 0;
    virtual void puts(const char* str) = 0;
    virtual char getc_blocking() = 0;
    virtual void clear_screen() = 0;
    // True once the input side has no more characters to deliver.
    virtual bool input_closed() const = 0;
};

struct TickTimerOps {
    virtual ~TickTimerOps() = default;
    virtual void init_tick_rate(uint8_t ticks_per_second) = 0;
    /// Current value of the 24-bit counter (upper byte always zero).
    virtual uint32_t read_ticks() = 0;
    virtual void set_ticks(uint32_t ticks) = 0;
    virtual uint8_t ticks_per_second() const = 0;
};

struct IRQControllerOps {
    virtual ~IRQControllerOps() = default;
    virtual void disable_tick_irq() = 0;
    virtual void enable_tick_irq() = 0;
    virtual bool tick_irq_enabled() const = 0;
};

class Platform {
public:
    virtual ~Platform() = default;
    virtual const char* get_name() const = 0;
    virtual UARTDriverOps* get_uart_ops() = 0;
    virtual TickTimerOps* get_timer_ops() = 0;
    virtual IRQControllerOps* get_irq_ops() = 0;
    [[noreturn]] virtual void panic(const char* msg, const char* file, int line) = 0;
};

/// Returns the platform the executable was built for.
Platform* get_platform();

} // namespace hal
} // namespace ux8

#endif // HAL_HPP
