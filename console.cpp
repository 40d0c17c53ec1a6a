// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file console.cpp
 * @brief Line input for the ux8 console.
 */

#include "console.hpp"
#include "util.hpp"

namespace ux8 {
namespace console {

void LineBuffer::clear() noexcept {
    data_.fill('\0');
    length_ = 0;
}

bool LineBuffer::push(char c) noexcept {
    if (length_ >= core::LINE_MAX) return false;
    data_[length_++] = c;
    data_[length_] = '\0';
    return true;
}

void LineBuffer::pop() noexcept {
    if (length_ == 0) return;
    data_[--length_] = '\0';
}

void LineBuffer::normalize() noexcept {
    util::normalize_line(data_.data(), length_);
}

bool read_line(hal::UARTDriverOps* uart_ops, LineBuffer& line) {
    line.clear();
    if (!uart_ops) return false;

    while (true) {
        char c = uart_ops->getc_blocking();
        if (c == '\r' || c == '\n') {
            break;
        }
        if (c == KEY_BACKSPACE || c == KEY_DELETE || c == KEY_PETSCII_DEL || c == KEY_PETSCII_LEFT) {
            line.pop();
            continue;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            continue;
        }
        line.push(c);
    }
    return !(line.empty() && uart_ops->input_closed());
}

bool read_normalized_line(hal::UARTDriverOps* uart_ops, LineBuffer& line) {
    bool ok = read_line(uart_ops, line);
    line.normalize();
    return ok;
}

} // namespace console
} // namespace ux8
