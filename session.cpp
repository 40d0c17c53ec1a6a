// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file session.cpp
 * @brief Interactive session setup for ux8 v0.1.
 */

#include "session.hpp"
#include "console.hpp"
#include "util.hpp"

namespace ux8 {
namespace session {

Session g_session;

void Session::set_username(std::string_view name) noexcept {
    name = util::skip_spaces(name);
    if (name.empty()) name = DEFAULT_USER;
    size_t n = util::min(name.length(), core::USER_MAX - 1);
    username_.fill('\0');
    util::kmemcpy(username_.data(), name.data(), n);
}

bool Session::setup(hal::UARTDriverOps* uart_ops, hal::IRQControllerOps* irq_ops, clock::ClockEngine& clock_engine) {
    if (!uart_ops) return false;

    core::ScopedISRLock lock(irq_ops);
    console::LineBuffer line;

    // Closed input leaves the answer empty, which selects the default.
    auto ask = [&](const char* prompt) -> std::string_view {
        uart_ops->puts(prompt);
        if (!console::read_normalized_line(uart_ops, line)) return {};
        return util::skip_spaces(line.view());
    };

    set_username(ask("USERNAME (MAX 15): "));
    clock_engine.set_date(ask("DATE (YYYY-MM-DD): "));
    auto tod = clock::parse_time(ask("TIME (HH:MM:SS): "));
    clock_engine.set_time_of_day(tod.value_or(clock::TimeOfDay{}));

    uart_ops->putc('\n');
    return true;
}

} // namespace session
} // namespace ux8
