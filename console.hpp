// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file console.hpp
 * @brief Line input for the ux8 console.
 * @details
 * Reads one line at a time from a UART, with the editing keys a C64 screen editor or a
 * terminal sends, and normalizes it to upper case for command matching.
 *
 * @version 0.1
 * @see console.cpp, hal.hpp, util.hpp
 */

#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include "core.hpp"
#include "hal.hpp"
#include <array>
#include <string_view>

namespace ux8 {
namespace console {

constexpr char KEY_BACKSPACE = 8;
constexpr char KEY_DELETE = 127;
constexpr char KEY_PETSCII_DEL = 20;
constexpr char KEY_PETSCII_LEFT = static_cast<char>(157);

/// Bounded, NUL-terminated line storage.
class LineBuffer {
public:
    std::string_view view() const noexcept { return std::string_view(data_.data(), length_); }
    const char* c_str() const noexcept { return data_.data(); }
    size_t length() const noexcept { return length_; }
    bool empty() const noexcept { return length_ == 0; }

    void clear() noexcept;
    bool push(char c) noexcept;   ///< false when LINE_MAX characters are already held
    void pop() noexcept;
    void normalize() noexcept;

private:
    std::array<char, core::LINE_MAX + 1> data_{};
    size_t length_ = 0;
};

/**
 * @brief Blocks until CR or LF, filling @p line.
 * @details Backspace keys drop the last character; characters past LINE_MAX and other
 *          control codes are ignored.
 * @return false when @p uart_ops is null or its input side closed before any character.
 */
bool read_line(hal::UARTDriverOps* uart_ops, LineBuffer& line);

/// read_line followed by LineBuffer::normalize.
bool read_normalized_line(hal::UARTDriverOps* uart_ops, LineBuffer& line);

} // namespace console
} // namespace ux8

#endif // CONSOLE_HPP
