// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file clock.cpp
 * @brief Clock and calendar engine implementation for ux8 v0.1.
 */

#include "clock.hpp"
#include "trace.hpp"
#include "util.hpp"

namespace ux8 {
namespace clock {

ClockEngine g_clock;

namespace {

constexpr std::array<uint8_t, 12> MONTH_DAYS = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

constexpr size_t YEAR_POS = 0;
constexpr size_t MONTH_POS = 5;
constexpr size_t DAY_POS = 8;

uint8_t digit(char c) noexcept { return static_cast<uint8_t>(c - '0'); }

uint8_t parse_2d(const char* p) noexcept {
    return static_cast<uint8_t>(digit(p[0]) * 10 + digit(p[1]));
}

bool is_2d(std::string_view text, size_t pos) noexcept {
    return util::isdigit(text[pos]) && util::isdigit(text[pos + 1]);
}

void increment_year(DateString& date) noexcept {
    for (size_t i = YEAR_POS + 4; i-- > YEAR_POS;) {
        if (date[i] != '9') {
            ++date[i];
            return;
        }
        date[i] = '0';
    }
}

} // namespace

TimeOfDay ticks_to_hms(uint32_t ticks, uint8_t ticks_per_second) noexcept {
    constexpr math::Uint24 one_hour = math::Uint24::from_u32(3600);
    constexpr math::Uint24 one_minute = math::Uint24::from_u32(60);

    math::Uint24 secs = math::div24_by_u8(math::Uint24::from_u32(ticks & core::TICK_MASK), ticks_per_second).quotient;
    TimeOfDay tod;
    while (!math::less24(secs, one_hour)) {
        secs = math::sub24(secs, one_hour);
        ++tod.hours;
    }
    while (!math::less24(secs, one_minute)) {
        secs = math::sub24(secs, one_minute);
        ++tod.minutes;
    }
    tod.seconds = secs.lo;
    return tod;
}

void format_time(const TimeOfDay& tod, char* out) noexcept {
    if (!out) return;
    util::format_2d(tod.hours, out);
    out[2] = ':';
    util::format_2d(tod.minutes, out + 3);
    out[5] = ':';
    util::format_2d(tod.seconds, out + 6);
}

void advance_date(DateString& date) noexcept {
    uint8_t month = parse_2d(date.data() + MONTH_POS);
    uint8_t day = static_cast<uint8_t>(parse_2d(date.data() + DAY_POS) + 1);

    uint8_t max_day = 31;
    if (month >= 1 && month <= 12) {
        max_day = MONTH_DAYS[month - 1];
    }
    if (month == 2) {
        uint8_t year_lo = parse_2d(date.data() + YEAR_POS + 2);
        if (year_lo % 4 == 0) max_day = 29;
    }

    if (day > max_day) {
        day = 1;
        ++month;
        if (month > 12) {
            month = 1;
            increment_year(date);
        }
        util::format_2d(month, date.data() + MONTH_POS);
    }
    util::format_2d(day, date.data() + DAY_POS);
}

bool is_date_string(std::string_view text) noexcept {
    if (text.length() != core::DATE_LEN) return false;
    if (text[4] != '-' || text[7] != '-') return false;
    return is_2d(text, 0) && is_2d(text, 2) && is_2d(text, MONTH_POS) && is_2d(text, DAY_POS);
}

std::optional<TimeOfDay> parse_time(std::string_view text) noexcept {
    if (text.length() != core::TIME_LEN) return std::nullopt;
    if (text[2] != ':' || text[5] != ':') return std::nullopt;
    if (!is_2d(text, 0) || !is_2d(text, 3) || !is_2d(text, 6)) return std::nullopt;
    TimeOfDay tod{parse_2d(text.data()), parse_2d(text.data() + 3), parse_2d(text.data() + 6)};
    if (tod.hours > 23 || tod.minutes > 59 || tod.seconds > 59) return std::nullopt;
    return tod;
}

void ClockEngine::init(hal::TickTimerOps* timer_ops) noexcept {
    timer_ops_ = timer_ops;
    util::kmemcpy(date_.data(), DEFAULT_DATE.data(), core::DATE_LEN);
    last_ticks_ = math::Uint24::from_u32(read_ticks());
}

uint32_t ClockEngine::read_ticks() const noexcept {
    return timer_ops_ ? (timer_ops_->read_ticks() & core::TICK_MASK) : 0;
}

bool ClockEngine::set_date(std::string_view text) noexcept {
    bool valid = is_date_string(text);
    std::string_view src = valid ? text : DEFAULT_DATE;
    util::kmemcpy(date_.data(), src.data(), core::DATE_LEN);
    return valid;
}

TimeOfDay ClockEngine::sample_time() const noexcept {
    uint8_t tps = timer_ops_ ? timer_ops_->ticks_per_second() : core::DEFAULT_TICKS_PER_SEC;
    return ticks_to_hms(read_ticks(), tps);
}

bool ClockEngine::detect_rollover() noexcept {
    math::Uint24 now = math::Uint24::from_u32(read_ticks());
    bool wrapped = math::less24(now, last_ticks_);
    if (wrapped) {
        advance_date(date_);
        trace::g_trace_manager.record_event(trace::EventType::DAY_ROLLOVER, date_view(), now.to_u32());
    }
    last_ticks_ = now;
    return wrapped;
}

void ClockEngine::set_time_of_day(const TimeOfDay& tod) noexcept {
    if (!timer_ops_) return;
    math::Uint24 secs = math::hms_to_seconds(tod.hours, tod.minutes, tod.seconds);
    math::Uint24 ticks = math::mul24_by_u8(secs, timer_ops_->ticks_per_second());
    timer_ops_->set_ticks(ticks.to_u32());
    last_ticks_ = math::Uint24::from_u32(read_ticks());
    trace::g_trace_manager.record_event(trace::EventType::CLOCK_SET, "TIME", ticks.to_u32());
}

core::Timestamp ClockEngine::stamp() const noexcept {
    core::Timestamp ts;
    ts.date = date_;
    format_time(sample_time(), ts.time.data());
    return ts;
}

} // namespace clock
} // namespace ux8
