// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file util.hpp
 * @brief Utility functions header for ux8 v0.1.
 */

#ifndef UTIL_HPP
#define UTIL_HPP

#include <string_view>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cstdarg>

namespace ux8 {
namespace util {

// Thin namespaced wrappers so subsystems share one spelling.
inline void* kmemcpy(void* dest, const void* src, size_t count) noexcept {
    return std::memcpy(dest, src, count);
}

inline void* kmemset(void* dest, int ch, size_t count) noexcept {
    return std::memset(dest, ch, count);
}

inline int kmemcmp(const void* ptr1, const void* ptr2, size_t count) noexcept {
    return std::memcmp(ptr1, ptr2, count);
}

inline size_t kstrlen(const char* str) noexcept {
    if (!str) return 0;
    return std::strlen(str);
}

// Character functions
inline bool isdigit(char c) noexcept {
    return (c >= '0' && c <= '9');
}
/**
 * @brief Uppercases a console line in place.
 * @details Maps ASCII 'a'..'z' and shifted PETSCII 0xC1..0xDA onto 'A'..'Z'. Stops at
 *          the first NUL or after @p len bytes.
 */
void normalize_line(char* line, size_t len) noexcept;

// Number to string conversion helpers (definitions in util.cpp)
int uint_to_str(uint32_t value, char* buffer, size_t buffer_size, int base = 10) noexcept;
int uint64_to_hex_str(uint64_t value, char* buffer, size_t buffer_size, bool leading_0x = true) noexcept;

/// Writes exactly two decimal digits (00..99) to @p out. Values above 99 are clamped.
void format_2d(uint8_t value, char* out) noexcept;

/// Formats @p value as "$HHHH" (upper-case, always four digits).
int format_hex16(uint16_t value, char* buffer, size_t buffer_size) noexcept;

/// Skips leading blanks, returns the next blank-delimited token and consumes it from @p input.
std::string_view get_next_token(std::string_view& input) noexcept;

/// Returns @p input without leading blanks.
std::string_view skip_spaces(std::string_view input) noexcept;

// Simplified snprintf-like functions (definitions in util.cpp)
int k_vsnprintf(char* buffer, size_t bufsz, const char* format, va_list args) noexcept;
int k_snprintf(char* buffer, size_t bufsz, const char* format, ...) noexcept __attribute__((format(printf, 3, 4)));

template <typename T>
constexpr const T& min(const T& a, const T& b) { return (b < a) ? b : a; }
template <typename T>
constexpr const T& max(const T& a, const T& b) { return (a < b) ? b : a; }

} // namespace util
} // namespace ux8

#endif // UTIL_HPP
