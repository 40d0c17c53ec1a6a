// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file ux8.cpp
 * @brief Shell bring-up for ux8 v0.1.
 * @details
 * Checks the platform drivers, initializes tracing, the file system and the clock,
 * runs session setup with the tick interrupt masked and then hands the console to
 * the command loop.
 *
 * @version 0.1
 * @see ux8.hpp, cli.hpp, session.hpp
 */

#include "ux8.hpp"
#include "cli.hpp"
#include "clock.hpp"
#include "fs.hpp"
#include "session.hpp"
#include "trace.hpp"

namespace ux8 {

int shell_main(const BootOptions& options) {
    if (!g_platform) return 1;

    auto* uart_ops = g_platform->get_uart_ops();
    auto* timer_ops = g_platform->get_timer_ops();
    auto* irq_ops = g_platform->get_irq_ops();
    if (!uart_ops || !timer_ops || !irq_ops) {
        g_platform->panic("Platform drivers missing", __FILE__, __LINE__);
    }

    timer_ops->init_tick_rate(options.ticks_per_second);

    trace::g_trace_manager.init();
    trace::g_trace_manager.set_enabled(options.trace);

    fs::g_file_system.init();
    clock::g_clock.init(timer_ops);
    cli::g_cli.init();

    cli::g_cli.print_banner(uart_ops);
    if (!session::g_session.setup(uart_ops, irq_ops, clock::g_clock)) {
        g_platform->panic("Session setup failed", __FILE__, __LINE__);
    }
    trace::g_trace_manager.record_event(trace::EventType::SHELL_START, session::g_session.username(),
                                        timer_ops->ticks_per_second());

    int status = cli::g_cli.run(uart_ops);

    if (options.trace) {
        trace::g_trace_manager.dump_trace(uart_ops);
    }
    return status == 0 ? 0 : 1;
}

} // namespace ux8
