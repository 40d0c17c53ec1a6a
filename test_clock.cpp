// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file test_clock.cpp
 * @brief Tests for the clock and calendar engine.
 */

#include "test_framework.hpp"
#include "mock_platform.hpp"
#include "clock.hpp"
#include <string_view>

namespace test {
namespace {

using ux8::clock::ClockEngine;
using ux8::clock::DateString;
using ux8::clock::TimeOfDay;

DateString make_date(std::string_view text) {
    DateString d{};
    for (size_t i = 0; i < d.size() && i < text.size(); ++i) d[i] = text[i];
    return d;
}

bool advances_to(std::string_view from, std::string_view to) {
    DateString d = make_date(from);
    ux8::clock::advance_date(d);
    return std::string_view(d.data(), d.size()) == to;
}

bool test_ticks_to_hms(ux8::hal::UARTDriverOps* uart_ops) {
    constexpr uint8_t ntsc = ux8::core::DEFAULT_TICKS_PER_SEC;
    constexpr uint8_t pal = ux8::core::PAL_TICKS_PER_SEC;
    if (!expect(ux8::clock::ticks_to_hms(0, ntsc) == TimeOfDay{0, 0, 0}, "ticks 0", uart_ops)) return false;
    if (!expect(ux8::clock::ticks_to_hms(3661u * ntsc, ntsc) == TimeOfDay{1, 1, 1}, "3661 s NTSC", uart_ops)) return false;
    if (!expect(ux8::clock::ticks_to_hms(3661u * pal, pal) == TimeOfDay{1, 1, 1}, "3661 s PAL", uart_ops)) return false;
    if (!expect(ux8::clock::ticks_to_hms(59, ntsc) == TimeOfDay{0, 0, 0}, "sub-second truncates", uart_ops)) return false;
    return expect(ux8::clock::ticks_to_hms(86399u * ntsc + ntsc - 1, ntsc) == TimeOfDay{23, 59, 59},
                  "last tick of the day", uart_ops);
}

bool test_format_time(ux8::hal::UARTDriverOps* uart_ops) {
    char buf[ux8::core::TIME_LEN];
    ux8::clock::format_time(TimeOfDay{7, 5, 9}, buf);
    return expect(std::string_view(buf, sizeof(buf)) == "07:05:09", "zero padded", uart_ops);
}

bool test_advance_date(ux8::hal::UARTDriverOps* uart_ops) {
    if (!expect(advances_to("2024-02-28", "2024-02-29"), "leap February", uart_ops)) return false;
    if (!expect(advances_to("2023-02-28", "2023-03-01"), "common February", uart_ops)) return false;
    if (!expect(advances_to("2024-02-29", "2024-03-01"), "leap day rolls to March", uart_ops)) return false;
    if (!expect(advances_to("2026-12-31", "2027-01-01"), "year end", uart_ops)) return false;
    if (!expect(advances_to("2029-12-31", "2030-01-01"), "year carry across digits", uart_ops)) return false;
    if (!expect(advances_to("9999-12-31", "0000-01-01"), "year wraps", uart_ops)) return false;
    if (!expect(advances_to("2024-04-30", "2024-05-01"), "30-day month", uart_ops)) return false;
    if (!expect(advances_to("2024-01-31", "2024-02-01"), "31-day month", uart_ops)) return false;
    if (!expect(advances_to("2024-01-09", "2024-01-10"), "day tens digit", uart_ops)) return false;
    if (!expect(advances_to("2000-02-28", "2000-02-29"), "2000 is leap", uart_ops)) return false;
    return expect(advances_to("0000-00-00", "0000-00-01"), "default date advances", uart_ops);
}

bool test_date_and_time_validation(ux8::hal::UARTDriverOps* uart_ops) {
    if (!expect(ux8::clock::is_date_string("2024-02-28"), "valid date", uart_ops)) return false;
    if (!expect(!ux8::clock::is_date_string("2024/02/28"), "wrong separators", uart_ops)) return false;
    if (!expect(!ux8::clock::is_date_string("24-02-28"), "short date", uart_ops)) return false;
    if (!expect(!ux8::clock::is_date_string("2024-0A-28"), "non-digit", uart_ops)) return false;
    auto tod = ux8::clock::parse_time("23:59:59");
    if (!expect(tod && *tod == TimeOfDay{23, 59, 59}, "valid time", uart_ops)) return false;
    if (!expect(!ux8::clock::parse_time("24:00:00"), "hour range", uart_ops)) return false;
    if (!expect(!ux8::clock::parse_time("12:60:00"), "minute range", uart_ops)) return false;
    if (!expect(!ux8::clock::parse_time("12:00:60"), "second range", uart_ops)) return false;
    return expect(!ux8::clock::parse_time("1:2:3"), "short time", uart_ops);
}

bool test_rollover_detected(ux8::hal::UARTDriverOps* uart_ops) {
    MockPlatform platform;
    ClockEngine engine;
    engine.init(&platform.timer());
    if (!expect(engine.set_date("2024-02-28"), "date accepted", uart_ops)) return false;

    engine.set_last_ticks(0x00FFFF);
    platform.timer().force_ticks(0x000010);
    if (!expect(engine.detect_rollover(), "wrap detected", uart_ops)) return false;
    if (!expect(engine.date_view() == "2024-02-29", "date advanced once", uart_ops)) return false;
    if (!expect(engine.last_ticks().to_u32() == 0x000010, "snapshot updated", uart_ops)) return false;

    if (!expect(!engine.detect_rollover(), "same tick is no wrap", uart_ops)) return false;
    return expect(engine.date_view() == "2024-02-29", "date unchanged", uart_ops);
}

bool test_rollover_not_detected(ux8::hal::UARTDriverOps* uart_ops) {
    MockPlatform platform;
    ClockEngine engine;
    engine.init(&platform.timer());
    if (!expect(engine.set_date("2023-12-31"), "date accepted", uart_ops)) return false;

    engine.set_last_ticks(0x000010);
    platform.timer().force_ticks(0x0000FF);
    if (!expect(!engine.detect_rollover(), "forward movement", uart_ops)) return false;
    if (!expect(engine.date_view() == "2023-12-31", "date unchanged", uart_ops)) return false;
    return expect(engine.last_ticks().to_u32() == 0x0000FF, "snapshot still updated", uart_ops);
}

bool test_set_time_of_day(ux8::hal::UARTDriverOps* uart_ops) {
    MockPlatform platform;
    ClockEngine engine;
    engine.init(&platform.timer());
    engine.set_time_of_day(TimeOfDay{1, 1, 1});
    if (!expect(platform.timer().read_ticks() == 3661u * 60, "counter primed", uart_ops)) return false;
    if (!expect(engine.last_ticks().to_u32() == 3661u * 60, "snapshot seeded", uart_ops)) return false;
    if (!expect(engine.sample_time() == TimeOfDay{1, 1, 1}, "sample reads back", uart_ops)) return false;

    platform.timer().init_tick_rate(ux8::core::PAL_TICKS_PER_SEC);
    engine.set_time_of_day(TimeOfDay{23, 59, 59});
    return expect(platform.timer().read_ticks() == 86399u * 50, "PAL priming", uart_ops);
}

bool test_stamp(ux8::hal::UARTDriverOps* uart_ops) {
    MockPlatform platform;
    ClockEngine engine;
    engine.init(&platform.timer());
    if (!expect(!engine.set_date("BAD"), "bad date rejected", uart_ops)) return false;
    if (!expect(engine.date_view() == ux8::clock::DEFAULT_DATE, "default date", uart_ops)) return false;
    if (!expect(engine.set_date("2025-07-04"), "date accepted", uart_ops)) return false;
    platform.timer().force_ticks((13u * 3600 + 14 * 60 + 15) * 60 + 30);
    ux8::core::Timestamp ts = engine.stamp();
    if (!expect(std::string_view(ts.date.data(), ts.date.size()) == "2025-07-04", "stamp date", uart_ops)) return false;
    return expect(std::string_view(ts.time.data(), ts.time.size()) == "13:14:15", "stamp time", uart_ops);
}

} // namespace

void register_clock_tests(TestFramework& tf) {
    tf.register_test({"clock_ticks_to_hms", test_ticks_to_hms, "Tick counter to time of day"});
    tf.register_test({"clock_format_time", test_format_time, "HH:MM:SS formatting"});
    tf.register_test({"clock_advance_date", test_advance_date, "Calendar increment with leap rule"});
    tf.register_test({"clock_validation", test_date_and_time_validation, "Date and time input validation"});
    tf.register_test({"clock_rollover_wrap", test_rollover_detected, "Wrap advances the date once"});
    tf.register_test({"clock_rollover_none", test_rollover_not_detected, "Forward ticks leave the date"});
    tf.register_test({"clock_set_time", test_set_time_of_day, "Priming the tick counter"});
    tf.register_test({"clock_stamp", test_stamp, "Creation stamps"});
}

} // namespace test
