// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file test_trace.cpp
 * @brief Tests for the event trace buffer and the hosted HAL.
 */

#include "test_framework.hpp"
#include "mock_platform.hpp"
#include "trace.hpp"
#include "hal/hal_host.hpp"
#include <string_view>

namespace test {
namespace {

using ux8::trace::EventType;
using ux8::trace::TraceManager;

bool test_trace_disabled(ux8::hal::UARTDriverOps* uart_ops) {
    TraceManager tm;
    tm.init();
    if (!expect(!tm.record_event(EventType::COMMAND, "LS"), "disabled by default", uart_ops)) return false;
    MockUART out;
    tm.dump_trace(&out);
    return expect(tm.recorded_count() == 0 && out.output_contains("Trace buffer empty"), "nothing recorded", uart_ops);
}

bool test_trace_record_and_dump(ux8::hal::UARTDriverOps* uart_ops) {
    MockPlatform platform;
    PlatformScope scope(&platform);
    platform.timer().force_ticks(0x1234);

    TraceManager tm;
    tm.init();
    tm.set_enabled(true);
    if (!expect(tm.record_event(EventType::FILE_CREATE, "AVERYLONGFILENAMEINDEED", 5), "recorded", uart_ops)) return false;
    const auto* last = tm.last_event();
    if (!expect(last && last->timestamp_ticks == 0x1234, "stamped with tick counter", uart_ops)) return false;
    if (!expect(std::string_view(last->name.data()) == "AVERYLONGFILENAM", "name clipped", uart_ops)) return false;

    MockUART out;
    tm.dump_trace(&out);
    if (!expect(out.output_contains("CREATE") && out.output_contains("T:1234") && out.output_contains("V:5"),
                "dump shows the event", uart_ops)) return false;
    tm.clear_trace();
    return expect(tm.recorded_count() == 0 && tm.last_event() == nullptr, "cleared", uart_ops);
}

bool test_trace_ring_wraps(ux8::hal::UARTDriverOps* uart_ops) {
    TraceManager tm;
    tm.init();
    tm.set_enabled(true);
    for (uint32_t i = 0; i < ux8::trace::MAX_TRACE_EVENTS + 6; ++i) {
        tm.record_event(EventType::COMMAND, "ECHO", i);
    }
    if (!expect(tm.recorded_count() == ux8::trace::MAX_TRACE_EVENTS + 6, "count keeps growing", uart_ops)) return false;
    if (!expect(tm.last_event()->value == ux8::trace::MAX_TRACE_EVENTS + 5, "latest event kept", uart_ops)) return false;
    MockUART out;
    tm.dump_trace(&out);
    // V:0..V:5 were overwritten; the oldest survivor is V:6.
    return expect(!out.output_contains("V:5\n") && out.output_contains("V:6\n"), "oldest entries overwritten", uart_ops);
}

bool test_host_timer(ux8::hal::UARTDriverOps* uart_ops) {
    ::hal::host::TimerDriver timer(ux8::core::DEFAULT_TICKS_PER_SEC);
    ::hal::host::IRQController irq(timer);

    irq.disable_tick_irq();
    timer.set_ticks(3600u * 60);
    if (!expect(timer.read_ticks() == 3600u * 60 && timer.read_ticks() == 3600u * 60, "frozen while masked", uart_ops)) return false;

    timer.init_tick_rate(ux8::core::PAL_TICKS_PER_SEC);
    if (!expect(timer.ticks_per_second() == 50 && timer.read_ticks() == 3600u * 50, "rate change keeps time", uart_ops)) return false;

    timer.set_ticks(86400u * 50 + 7);
    if (!expect(timer.read_ticks() == 7, "wraps at midnight", uart_ops)) return false;

    irq.enable_tick_irq();
    uint32_t t = timer.read_ticks();
    if (!expect(irq.tick_irq_enabled() && t >= 7 && t < 86400u * 50, "running again", uart_ops)) return false;

    ::hal::host::PlatformHost host;
    return expect(host.get_uart_ops() && host.get_timer_ops() && host.get_irq_ops() &&
                  std::string_view(host.get_name()).ends_with("HOST"), "host platform wired", uart_ops);
}

} // namespace

void register_trace_tests(TestFramework& tf) {
    tf.register_test({"trace_disabled", test_trace_disabled, "Disabled tracing records nothing"});
    tf.register_test({"trace_record_dump", test_trace_record_and_dump, "Record, dump and clear"});
    tf.register_test({"trace_ring", test_trace_ring_wraps, "Ring buffer overwrite"});
}

void register_hal_host_tests(TestFramework& tf) {
    tf.register_test({"hal_host_timer", test_host_timer, "Simulated jiffy clock"});
}

} // namespace test
