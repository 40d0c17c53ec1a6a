// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file hal_host.cpp
 * @brief Hosted (Linux/POSIX) HAL implementation for ux8 v0.1.
 */

#include "hal_host.hpp"
#include <cstdio>
#include <cstdlib>

namespace hal::host {

// --- UARTDriver ---
void UARTDriver::putc(char c) {
    std::fputc(static_cast<unsigned char>(c), stdout);
    if (c == '\n') std::fflush(stdout);
}

void UARTDriver::puts(const char* str) {
    if (!str) return;
    std::fputs(str, stdout);
    std::fflush(stdout);
}

char UARTDriver::getc_blocking() {
    if (input_closed_) return '\n';
    int c = std::getchar();
    if (c == EOF) {
        input_closed_ = true;
        return '\n';
    }
    return static_cast<char>(c);
}

void UARTDriver::clear_screen() {
    this->puts("\x1B[2J\x1B[H");
}

// --- TimerDriver ---
TimerDriver::TimerDriver(uint8_t ticks_per_second)
    : ticks_per_second_(ticks_per_second ? ticks_per_second : ux8::core::DEFAULT_TICKS_PER_SEC),
      origin_(Clock::now()) {}

uint32_t TimerDriver::ticks_per_day() const noexcept {
    return ux8::core::SECONDS_PER_DAY * ticks_per_second_;
}

uint32_t TimerDriver::live_ticks() const {
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - origin_).count();
    uint64_t elapsed_ticks = static_cast<uint64_t>(elapsed_ms) * ticks_per_second_ / 1000;
    return static_cast<uint32_t>((origin_ticks_ + elapsed_ticks) % ticks_per_day());
}

uint32_t TimerDriver::read_ticks() {
    return frozen_ ? frozen_ticks_ : live_ticks();
}

void TimerDriver::set_ticks(uint32_t ticks) {
    ticks = (ticks & ux8::core::TICK_MASK) % ticks_per_day();
    origin_ = Clock::now();
    origin_ticks_ = ticks;
    frozen_ticks_ = ticks;
}

void TimerDriver::init_tick_rate(uint8_t tps) {
    if (tps == 0) return;
    uint32_t now = read_ticks();
    uint32_t seconds = now / ticks_per_second_;
    ticks_per_second_ = tps;
    set_ticks(seconds * tps);
}

void TimerDriver::freeze() {
    if (frozen_) return;
    frozen_ticks_ = live_ticks();
    frozen_ = true;
}

void TimerDriver::thaw() {
    if (!frozen_) return;
    origin_ = Clock::now();
    origin_ticks_ = frozen_ticks_;
    frozen_ = false;
}

// --- IRQController ---
void IRQController::disable_tick_irq() {
    timer_.freeze();
    enabled_ = false;
}

void IRQController::enable_tick_irq() {
    timer_.thaw();
    enabled_ = true;
}

// --- PlatformHost ---
PlatformHost::PlatformHost() : irq_(timer_) {}

const char* PlatformHost::get_name() const {
#if defined(__x86_64__)
    return "X86_64 HOST";
#elif defined(__aarch64__)
    return "ARM64 HOST";
#else
    return "HOST";
#endif
}

void PlatformHost::panic(const char* msg, const char* file, int line) {
    std::fprintf(stderr, "\n*** UX8 PANIC: %s (%s:%d)\n", msg ? msg : "?", file ? file : "?", line);
    std::fflush(stderr);
    std::abort();
}

} // namespace hal::host
