// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file cli.hpp
 * @brief Command shell header for ux8 v0.1.
 * @details
 * An ordered table of {keyword, handler, help text}. A line matches a keyword when it
 * starts with it and the next character is a space or the end of the line; the first
 * match in table order runs. Handlers receive the text after the keyword.
 *
 * @version 0.1
 * @see cli.cpp, fs.hpp, clock.hpp, session.hpp
 */

#ifndef CLI_HPP
#define CLI_HPP

#include "core.hpp"
#include "hal.hpp"
#include <array>
#include <optional>
#include <string_view>

namespace ux8 {
namespace cli {

using CommandHandler = int (*)(const char* args, hal::UARTDriverOps* uart_ops);

/// Handler result that ends the shell loop.
constexpr int CMD_EXIT = 1;
constexpr size_t MAX_COMMANDS = 16;

inline constexpr const char* PROMPT = "UX8 % ";

struct Command {
    const char* name = nullptr;
    CommandHandler handler = nullptr;
    const char* help_text = nullptr;
};

/**
 * @brief Keyword test with boundary check.
 * @return The text following the keyword, or std::nullopt when @p line does not start
 *         with @p keyword followed by a space or the end of the line.
 */
std::optional<std::string_view> match_keyword(std::string_view line, std::string_view keyword) noexcept;

class CLI {
public:
    /// Resets the table to the built-in commands.
    void init();

    bool register_command(const char* name, CommandHandler handler, const char* help_text);

    /**
     * @brief Dispatches one normalized, NUL-terminated line.
     * @return 0 for a blank line or a successful command, -1 for a reported failure or an
     *         unknown command, CMD_EXIT for EXIT.
     */
    int process_line(const char* line, hal::UARTDriverOps* uart_ops);

    /// Prompt, read, dispatch until EXIT or end of input.
    int run(hal::UARTDriverOps* uart_ops);

    void print_banner(hal::UARTDriverOps* uart_ops) const;
    void print_help(hal::UARTDriverOps* uart_ops) const;

    size_t command_count() const noexcept { return num_commands_; }

private:
    std::array<Command, MAX_COMMANDS> commands_{};
    size_t num_commands_ = 0;
};

extern CLI g_cli;

} // namespace cli
} // namespace ux8

#endif // CLI_HPP
