// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file session.hpp
 * @brief Interactive session setup for ux8 v0.1.
 * @details
 * Asks for the user name, the date and the time of day once at start-up. The time primes
 * the tick counter; the whole sequence runs with the tick interrupt masked.
 *
 * @version 0.1
 * @see session.cpp, clock.hpp, console.hpp
 */

#ifndef SESSION_HPP
#define SESSION_HPP

#include "core.hpp"
#include "hal.hpp"
#include "clock.hpp"
#include <array>
#include <string_view>

namespace ux8 {
namespace session {

inline constexpr std::string_view DEFAULT_USER = "USER";

class Session {
public:
    /**
     * @brief Runs the three setup prompts.
     * @details Empty or malformed answers fall back to DEFAULT_USER, clock::DEFAULT_DATE
     *          and clock::DEFAULT_TIME.
     * @return false when the console is missing.
     */
    bool setup(hal::UARTDriverOps* uart_ops, hal::IRQControllerOps* irq_ops, clock::ClockEngine& clock_engine);

    std::string_view username() const noexcept { return std::string_view(username_.data()); }
    void set_username(std::string_view name) noexcept;

private:
    std::array<char, core::USER_MAX> username_{'U', 'S', 'E', 'R'};
};

extern Session g_session;

} // namespace session
} // namespace ux8

#endif // SESSION_HPP
