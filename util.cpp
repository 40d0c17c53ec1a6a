// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file util.cpp
 * @brief Utility functions implementation for ux8 v0.1.
 */

#include "util.hpp"
#include <cstdarg> // For va_list in k_vsnprintf

namespace ux8 {
namespace util {

void normalize_line(char* line, size_t len) noexcept {
    if (!line) return;
    for (size_t i = 0; i < len && line[i] != '\0'; ++i) {
        auto c = static_cast<unsigned char>(line[i]);
        if (c >= 'a' && c <= 'z') {
            line[i] = static_cast<char>(c - 0x20);
        } else if (c >= 0xC1 && c <= 0xDA) {
            line[i] = static_cast<char>(c - 0x80);
        }
    }
}

static char* reverse_str(char* str, int length) {
    int start = 0; int end = length - 1;
    while (start < end) { char temp = str[start]; str[start] = str[end]; str[end] = temp; start++; end--; }
    return str;
}

static int num_to_str_base_internal(uint64_t value, char* buffer, size_t buffer_size, int base) {
    if (buffer_size == 0) return -1;
    if (base < 2 || base > 36) {
        buffer[0] = '\0';
        return -1;
    }
    char* ptr = buffer;
    if (value == 0) {
        if (buffer_size < 2) { buffer[0] = '\0'; return -1; }
        *ptr++ = '0';
        *ptr = '\0';
        return 1;
    }
    int num_digits = 0;
    while (value > 0) {
        if (static_cast<size_t>(num_digits + 1) >= buffer_size) {
            buffer[min(static_cast<size_t>(num_digits), buffer_size - 1)] = '\0';
            return -1;
        }
        int remainder = static_cast<int>(value % static_cast<unsigned int>(base));
        *ptr++ = (remainder > 9) ? static_cast<char>((remainder - 10) + 'A') : static_cast<char>(remainder + '0');
        value /= static_cast<unsigned int>(base);
        num_digits++;
    }
    *ptr = '\0';
    reverse_str(buffer, num_digits);
    return num_digits;
}

int uint_to_str(uint32_t value, char* buffer, size_t buffer_size, int base) noexcept {
    return num_to_str_base_internal(value, buffer, buffer_size, base);
}

int uint64_to_hex_str(uint64_t value, char* buffer, size_t buffer_size, bool leading_0x) noexcept {
    if (buffer_size == 0) return -1;
    char* ptr = buffer;
    size_t current_written = 0;
    if (leading_0x) {
        if (buffer_size < 3) { buffer[0] = '\0'; return -1; }
        *ptr++ = '0'; *ptr++ = 'x'; current_written += 2;
    }
    int digits_len = num_to_str_base_internal(value, ptr, buffer_size - current_written, 16);
    if (digits_len < 0) { buffer[0] = '\0'; return -1; }
    return static_cast<int>(current_written + static_cast<size_t>(digits_len));
}

void format_2d(uint8_t value, char* out) noexcept {
    if (!out) return;
    if (value > 99) value = 99;
    out[0] = static_cast<char>('0' + value / 10);
    out[1] = static_cast<char>('0' + value % 10);
}

int format_hex16(uint16_t value, char* buffer, size_t buffer_size) noexcept {
    static constexpr char hex_chars[] = "0123456789ABCDEF";
    if (!buffer || buffer_size < 6) {
        if (buffer && buffer_size > 0) buffer[0] = '\0';
        return -1;
    }
    buffer[0] = '$';
    for (int i = 4; i >= 1; --i) {
        buffer[i] = hex_chars[value & 0xF];
        value = static_cast<uint16_t>(value >> 4);
    }
    buffer[5] = '\0';
    return 5;
}

std::string_view skip_spaces(std::string_view input) noexcept {
    size_t start = 0;
    while (start < input.length() && input[start] == ' ') { start++; }
    return input.substr(start);
}

std::string_view get_next_token(std::string_view& input_ref) noexcept {
    std::string_view current_input = skip_spaces(input_ref);
    size_t pos = 0;
    while (pos < current_input.length() && current_input[pos] != ' ') { pos++; }
    std::string_view token = current_input.substr(0, pos);
    current_input.remove_prefix(pos);
    input_ref = current_input;
    return token;
}

int k_vsnprintf(char* buffer, size_t bufsz, const char* format, va_list args) noexcept {
    if (!buffer || bufsz == 0 || !format) { if (buffer && bufsz > 0) buffer[0] = '\0'; return 0; }
    char* buf_ptr = buffer;
    char* const buf_write_end = buffer + bufsz - 1;
    int total_written_chars = 0;
    char temp_num_buf[24];

    while (*format && buf_ptr < buf_write_end) {
        if (*format == '%') {
            format++;
            bool is_long_long = false;
            if (format[0] == 'l' && format[1] == 'l') {
                is_long_long = true; format += 2;
            }
            int current_segment_len = 0;
            const char* str_to_copy_from = temp_num_buf;

            switch (*format) {
                case 's': {
                    const char* s_arg = va_arg(args, const char*);
                    if (!s_arg) s_arg = "(null)";
                    str_to_copy_from = s_arg;
                    current_segment_len = static_cast<int>(kstrlen(s_arg));
                    break;
                }
                case 'c': {
                    temp_num_buf[0] = static_cast<char>(va_arg(args, int));
                    temp_num_buf[1] = '\0'; current_segment_len = 1;
                    break;
                }
                case 'u': {
                    if (is_long_long) current_segment_len = num_to_str_base_internal(va_arg(args, unsigned long long), temp_num_buf, sizeof(temp_num_buf), 10);
                    else current_segment_len = uint_to_str(va_arg(args, unsigned int), temp_num_buf, sizeof(temp_num_buf));
                    break;
                }
                case 'x': case 'X': {
                    uint64_t hex_val;
                    if (is_long_long) hex_val = va_arg(args, unsigned long long);
                    else hex_val = va_arg(args, unsigned int);
                    current_segment_len = uint64_to_hex_str(hex_val, temp_num_buf, sizeof(temp_num_buf), false);
                    break;
                }
                case '%': {
                    temp_num_buf[0] = '%'; temp_num_buf[1] = '\0'; current_segment_len = 1;
                    break;
                }
                default: {
                    if (buf_ptr < buf_write_end) { *buf_ptr++ = '%'; total_written_chars++; }
                    if (*format && buf_ptr < buf_write_end) { *buf_ptr++ = *format; total_written_chars++; }
                    str_to_copy_from = nullptr;
                    break;
                }
            }

            if (str_to_copy_from && current_segment_len > 0) {
                for (int k = 0; k < current_segment_len && buf_ptr < buf_write_end; ++k) {
                    *buf_ptr++ = str_to_copy_from[k];
                    total_written_chars++;
                }
            }
            if (*format == '\0') break;
        } else {
            *buf_ptr++ = *format;
            total_written_chars++;
        }
        format++;
    }
    *buf_ptr = '\0';
    return total_written_chars;
}

int k_snprintf(char* buffer, size_t bufsz, const char* format, ...) noexcept {
    va_list args;
    va_start(args, format);
    int result = k_vsnprintf(buffer, bufsz, format, args);
    va_end(args);
    return result;
}

} // namespace util
} // namespace ux8
