// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal_host.hpp
 * @brief Hosted (Linux/POSIX) HAL for ux8 v0.1.
 * @details
 * Runs the shell as an ordinary process: the console is stdin/stdout and the jiffy
 * counter is simulated from the monotonic clock, wrapping at midnight like the
 * KERNAL clock it stands in for.
 */

#ifndef HAL_HOST_HPP
#define HAL_HOST_HPP

#include "../hal.hpp"
#include "../core.hpp"
#include <chrono>
#include <cstdint>

namespace hal::host { // This is a global namespace, not under ux8::hal

class UARTDriver : public ux8::hal::UARTDriverOps {
public:
    void putc(char c) override;
    void puts(const char* str) override;
    char getc_blocking() override;
    void clear_screen() override;
    bool input_closed() const override { return input_closed_; }
private:
    bool input_closed_ = false;
};

class TimerDriver : public ux8::hal::TickTimerOps {
public:
    explicit TimerDriver(uint8_t ticks_per_second = ux8::core::DEFAULT_TICKS_PER_SEC);
    uint32_t read_ticks() override;
    void set_ticks(uint32_t ticks) override;
    uint8_t ticks_per_second() const override { return ticks_per_second_; }
    void init_tick_rate(uint8_t ticks_per_second) override;

    void freeze();
    void thaw();
private:
    using Clock = std::chrono::steady_clock;
    uint32_t ticks_per_day() const noexcept;
    uint32_t live_ticks() const;

    uint8_t ticks_per_second_;
    Clock::time_point origin_;
    uint32_t origin_ticks_ = 0;
    bool frozen_ = false;
    uint32_t frozen_ticks_ = 0;
};

class IRQController : public ux8::hal::IRQControllerOps {
public:
    explicit IRQController(TimerDriver& timer) : timer_(timer) {}
    void disable_tick_irq() override;
    void enable_tick_irq() override;
    bool tick_irq_enabled() const override { return enabled_; }
private:
    TimerDriver& timer_;
    bool enabled_ = true;
};

class PlatformHost : public ux8::hal::Platform {
public:
    PlatformHost();
    const char* get_name() const override;
    ux8::hal::UARTDriverOps* get_uart_ops() override { return &uart_; }
    ux8::hal::TickTimerOps* get_timer_ops() override { return &timer_; }
    ux8::hal::IRQControllerOps* get_irq_ops() override { return &irq_; }
    [[noreturn]] void panic(const char* msg, const char* file, int line) override;
private:
    UARTDriver uart_;
    TimerDriver timer_;
    IRQController irq_;
};

} // namespace hal::host

#endif // HAL_HOST_HPP
