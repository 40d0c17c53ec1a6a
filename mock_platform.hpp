// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file mock_platform.hpp
 * @brief Scriptable platform for ux8 unit tests.
 * @details
 * Scripted console input, captured output, a tick counter that only moves when a test
 * sets it, and interrupt-mask bookkeeping.
 */

#ifndef MOCK_PLATFORM_HPP
#define MOCK_PLATFORM_HPP

#include "ux8.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

namespace test {

class MockUART : public ux8::hal::UARTDriverOps {
public:
    void putc(char c) override { output_ += c; }
    void puts(const char* str) override { if (str) output_ += str; }
    char getc_blocking() override {
        if (pos_ < input_.size()) return input_[pos_++];
        closed_ = true;
        return '\n';
    }
    void clear_screen() override { ++clear_count_; }
    bool input_closed() const override { return closed_; }

    void feed(std::string_view text) { input_.append(text); }
    const std::string& output() const noexcept { return output_; }
    bool output_contains(std::string_view text) const { return output_.find(text) != std::string::npos; }
    void clear_output() { output_.clear(); }
    int clear_count() const noexcept { return clear_count_; }

private:
    std::string input_;
    size_t pos_ = 0;
    bool closed_ = false;
    std::string output_;
    int clear_count_ = 0;
};

class MockIRQ : public ux8::hal::IRQControllerOps {
public:
    void disable_tick_irq() override { enabled_ = false; ++disable_count_; }
    void enable_tick_irq() override { enabled_ = true; ++enable_count_; }
    bool tick_irq_enabled() const override { return enabled_; }

    int disable_count() const noexcept { return disable_count_; }
    int enable_count() const noexcept { return enable_count_; }

private:
    bool enabled_ = true;
    int disable_count_ = 0;
    int enable_count_ = 0;
};

class MockTimer : public ux8::hal::TickTimerOps {
public:
    explicit MockTimer(const MockIRQ& irq) : irq_(irq) {}

    void init_tick_rate(uint8_t ticks_per_second) override { tps_ = ticks_per_second; }
    uint32_t read_ticks() override { return ticks_ & ux8::core::TICK_MASK; }
    void set_ticks(uint32_t ticks) override {
        ticks_ = ticks & ux8::core::TICK_MASK;
        ++set_count_;
        last_set_masked_ = !irq_.tick_irq_enabled();
    }
    uint8_t ticks_per_second() const override { return tps_; }

    /// Moves the counter without counting as a priming write.
    void force_ticks(uint32_t ticks) noexcept { ticks_ = ticks & ux8::core::TICK_MASK; }
    int set_count() const noexcept { return set_count_; }
    bool last_set_masked() const noexcept { return last_set_masked_; }

private:
    const MockIRQ& irq_;
    uint32_t ticks_ = 0;
    uint8_t tps_ = ux8::core::DEFAULT_TICKS_PER_SEC;
    int set_count_ = 0;
    bool last_set_masked_ = false;
};

class MockPlatform : public ux8::hal::Platform {
public:
    MockPlatform() : timer_(irq_) {}

    const char* get_name() const override { return "MOCK"; }
    ux8::hal::UARTDriverOps* get_uart_ops() override { return &uart_; }
    ux8::hal::TickTimerOps* get_timer_ops() override { return &timer_; }
    ux8::hal::IRQControllerOps* get_irq_ops() override { return &irq_; }
    [[noreturn]] void panic(const char* msg, const char* file, int line) override {
        std::fprintf(stderr, "MOCK PANIC: %s (%s:%d)\n", msg, file, line);
        std::abort();
    }

    MockUART& uart() noexcept { return uart_; }
    MockTimer& timer() noexcept { return timer_; }
    MockIRQ& irq() noexcept { return irq_; }

private:
    MockUART uart_;
    MockIRQ irq_;
    MockTimer timer_;
};

/// Installs a platform as ux8::g_platform for the lifetime of the guard.
class PlatformScope {
public:
    explicit PlatformScope(ux8::hal::Platform* platform) : previous_(ux8::g_platform) { ux8::g_platform = platform; }
    ~PlatformScope() { ux8::g_platform = previous_; }
    PlatformScope(const PlatformScope&) = delete;
    PlatformScope& operator=(const PlatformScope&) = delete;

private:
    ux8::hal::Platform* previous_;
};

} // namespace test

#endif // MOCK_PLATFORM_HPP
