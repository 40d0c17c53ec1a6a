// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file fixed_math.hpp
 * @brief 16/24-bit fixed-width arithmetic helpers for ux8 v0.1.
 * @details
 * The clock engine works on the raw 24-bit jiffy value as three bytes, the way the
 * counter is exposed by the hardware. These helpers keep every step exact: addition
 * with carry, multiplication by repeated addition and restoring binary long division.
 *
 * @version 0.1
 * @see fixed_math.cpp, clock.hpp
 */

#ifndef FIXED_MATH_HPP
#define FIXED_MATH_HPP

#include <cstdint>

namespace ux8 {
namespace math {

/// Three-byte little-endian unsigned value (0..0xFFFFFF).
struct Uint24 {
    uint8_t lo = 0;
    uint8_t mid = 0;
    uint8_t hi = 0;

    static constexpr Uint24 from_u32(uint32_t v) noexcept {
        return Uint24{static_cast<uint8_t>(v & 0xFF),
                      static_cast<uint8_t>((v >> 8) & 0xFF),
                      static_cast<uint8_t>((v >> 16) & 0xFF)};
    }
    constexpr uint32_t to_u32() const noexcept {
        return static_cast<uint32_t>(lo) | (static_cast<uint32_t>(mid) << 8) | (static_cast<uint32_t>(hi) << 16);
    }
    constexpr bool operator==(const Uint24&) const noexcept = default;
};

struct DivResult24 {
    Uint24 quotient;
    uint8_t remainder;
};

/// 16-bit add with carry out. Returns the wrapped sum.
uint16_t add16(uint16_t a, uint16_t b, bool* carry_out = nullptr) noexcept;

/// 24-bit add, byte by byte with carry. Overflow past 0xFFFFFF wraps.
Uint24 add24(Uint24 a, Uint24 b) noexcept;

/// 24-bit subtract with borrow. Underflow wraps.
Uint24 sub24(Uint24 a, Uint24 b) noexcept;

/// @p value * @p factor computed by adding @p value into a 24-bit accumulator @p factor times.
Uint24 mul24_by_u8(Uint24 value, uint8_t factor) noexcept;

/**
 * @brief Restoring binary long division of a 24-bit dividend by an 8-bit divisor.
 * @details Shifts the dividend out MSB first into a partial remainder; each step
 *          subtracts the divisor when it fits and shifts a quotient bit in. Division by
 *          zero yields an all-ones quotient and a zero remainder.
 */
DivResult24 div24_by_u8(Uint24 dividend, uint8_t divisor) noexcept;

/// True when @p a < @p b, comparing from the most-significant byte down.
bool less24(Uint24 a, Uint24 b) noexcept;

/// hours*3600 + minutes*60 + seconds by repeated addition. 23:59:59 needs 17 bits, hence 24-bit.
Uint24 hms_to_seconds(uint8_t hours, uint8_t minutes, uint8_t seconds) noexcept;

} // namespace math
} // namespace ux8

#endif // FIXED_MATH_HPP
