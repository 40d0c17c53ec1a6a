// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file clock.hpp
 * @brief Clock and calendar engine header for ux8 v0.1.
 * @details
 * Turns the free-running 24-bit tick counter into a time of day, keeps the session date
 * string and advances it by one day whenever the counter is seen to wrap. The counter is
 * sampled on demand; nothing here runs from an interrupt.
 *
 * @version 0.1
 * @see clock.cpp, fixed_math.hpp, hal.hpp
 */

#ifndef CLOCK_HPP
#define CLOCK_HPP

#include "core.hpp"
#include "hal.hpp"
#include "fixed_math.hpp"
#include <array>
#include <optional>
#include <string_view>
#include <cstdint>

namespace ux8 {
namespace clock {

struct TimeOfDay {
    uint8_t hours = 0;
    uint8_t minutes = 0;
    uint8_t seconds = 0;

    constexpr bool operator==(const TimeOfDay&) const noexcept = default;
};

using DateString = std::array<char, core::DATE_LEN>;

inline constexpr std::string_view DEFAULT_DATE = "0000-00-00";
inline constexpr std::string_view DEFAULT_TIME = "00:00:00";

/**
 * @brief Pure tick to H/M/S conversion.
 * @details seconds = ticks / ticks_per_second by restoring division (truncating), then
 *          hours and minutes are peeled off by repeated subtraction of 3600 and 60.
 */
TimeOfDay ticks_to_hms(uint32_t ticks, uint8_t ticks_per_second) noexcept;

/// Writes "HH:MM:SS" into @p out (TIME_LEN characters, no terminator).
void format_time(const TimeOfDay& tod, char* out) noexcept;

/**
 * @brief Advances a "YYYY-MM-DD" string by one day, in place.
 * @details February has 29 days when the last two year digits are divisible by four
 *          (2000-2099 only). A month outside 1..12 is given 31 days. Past December the
 *          year is carried digit by digit; "9999" wraps to "0000".
 */
void advance_date(DateString& date) noexcept;

/// True for "DDDD-DD-DD" where every D is a decimal digit.
bool is_date_string(std::string_view text) noexcept;

/// Parses "HH:MM:SS" with H < 24, M < 60, S < 60.
std::optional<TimeOfDay> parse_time(std::string_view text) noexcept;

class ClockEngine {
public:
    void init(hal::TickTimerOps* timer_ops) noexcept;

    /// Accepts a "YYYY-MM-DD" string; anything else selects DEFAULT_DATE. Returns whether @p text was used.
    bool set_date(std::string_view text) noexcept;
    const DateString& date() const noexcept { return date_; }
    std::string_view date_view() const noexcept { return std::string_view(date_.data(), date_.size()); }

    TimeOfDay sample_time() const noexcept;

    /**
     * @brief Advances the date once if the counter is below the last snapshot.
     * @details The comparison is the 24-bit one from the most significant byte down. The
     *          snapshot is always replaced by the current counter value.
     * @return true when a wrap was detected.
     */
    bool detect_rollover() noexcept;

    /**
     * @brief Primes the tick counter to @p tod and seeds the rollover snapshot from it.
     * @details Call with the tick interrupt masked so the two steps see the same value.
     */
    void set_time_of_day(const TimeOfDay& tod) noexcept;

    /// Date and current time for a new directory entry.
    core::Timestamp stamp() const noexcept;

    math::Uint24 last_ticks() const noexcept { return last_ticks_; }
    void set_last_ticks(uint32_t ticks) noexcept { last_ticks_ = math::Uint24::from_u32(ticks & core::TICK_MASK); }

private:
    uint32_t read_ticks() const noexcept;

    hal::TickTimerOps* timer_ops_ = nullptr;
    DateString date_{'0', '0', '0', '0', '-', '0', '0', '-', '0', '0'};
    math::Uint24 last_ticks_{};
};

extern ClockEngine g_clock;

} // namespace clock
} // namespace ux8

#endif // CLOCK_HPP
