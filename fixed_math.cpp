// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file fixed_math.cpp
 * @brief 16/24-bit fixed-width arithmetic helpers for ux8 v0.1.
 */

#include "fixed_math.hpp"

namespace ux8 {
namespace math {

uint16_t add16(uint16_t a, uint16_t b, bool* carry_out) noexcept {
    uint32_t sum = static_cast<uint32_t>(a) + b;
    if (carry_out) *carry_out = sum > 0xFFFF;
    return static_cast<uint16_t>(sum);
}

Uint24 add24(Uint24 a, Uint24 b) noexcept {
    Uint24 r;
    unsigned carry = 0;
    unsigned t = static_cast<unsigned>(a.lo) + b.lo;
    r.lo = static_cast<uint8_t>(t);
    carry = t >> 8;
    t = static_cast<unsigned>(a.mid) + b.mid + carry;
    r.mid = static_cast<uint8_t>(t);
    carry = t >> 8;
    t = static_cast<unsigned>(a.hi) + b.hi + carry;
    r.hi = static_cast<uint8_t>(t);
    return r;
}

Uint24 sub24(Uint24 a, Uint24 b) noexcept {
    Uint24 r;
    int borrow = 0;
    int t = static_cast<int>(a.lo) - b.lo;
    borrow = t < 0;
    r.lo = static_cast<uint8_t>(t + (borrow ? 0x100 : 0));
    t = static_cast<int>(a.mid) - b.mid - borrow;
    borrow = t < 0;
    r.mid = static_cast<uint8_t>(t + (borrow ? 0x100 : 0));
    t = static_cast<int>(a.hi) - b.hi - borrow;
    r.hi = static_cast<uint8_t>(t + (t < 0 ? 0x100 : 0));
    return r;
}

Uint24 mul24_by_u8(Uint24 value, uint8_t factor) noexcept {
    Uint24 acc;
    for (uint8_t i = 0; i < factor; ++i) {
        acc = add24(acc, value);
    }
    return acc;
}

DivResult24 div24_by_u8(Uint24 dividend, uint8_t divisor) noexcept {
    if (divisor == 0) {
        return DivResult24{Uint24{0xFF, 0xFF, 0xFF}, 0};
    }
    uint32_t n = dividend.to_u32();
    uint32_t quotient = 0;
    // Nine bits: the partial remainder can reach 2*divisor-1 before the compare.
    uint16_t rem = 0;
    for (int bit = 0; bit < 24; ++bit) {
        rem = static_cast<uint16_t>((rem << 1) | ((n >> 23) & 1));
        n = (n << 1) & 0xFFFFFF;
        quotient <<= 1;
        if (rem >= divisor) {
            rem = static_cast<uint16_t>(rem - divisor);
            quotient |= 1;
        }
    }
    return DivResult24{Uint24::from_u32(quotient), static_cast<uint8_t>(rem)};
}

bool less24(Uint24 a, Uint24 b) noexcept {
    if (a.hi != b.hi) return a.hi < b.hi;
    if (a.mid != b.mid) return a.mid < b.mid;
    return a.lo < b.lo;
}

Uint24 hms_to_seconds(uint8_t hours, uint8_t minutes, uint8_t seconds) noexcept {
    constexpr Uint24 one_hour = Uint24::from_u32(3600);
    constexpr Uint24 one_minute = Uint24::from_u32(60);
    Uint24 total;
    for (uint8_t h = hours; h > 0; --h) total = add24(total, one_hour);
    for (uint8_t m = minutes; m > 0; --m) total = add24(total, one_minute);
    return add24(total, Uint24{seconds, 0, 0});
}

} // namespace math
} // namespace ux8
