// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file test_fixed_math.cpp
 * @brief Tests for the 16/24-bit arithmetic helpers.
 */

#include "test_framework.hpp"
#include "fixed_math.hpp"

namespace test {
namespace {

using ux8::math::Uint24;

bool test_add16_carry(ux8::hal::UARTDriverOps* uart_ops) {
    bool carry = true;
    uint16_t sum = ux8::math::add16(0x6000, 0x0005, &carry);
    if (!expect(sum == 0x6005 && !carry, "0x6000 + 5 without carry", uart_ops)) return false;
    sum = ux8::math::add16(0xFFF0, 0x0020, &carry);
    return expect(sum == 0x0010 && carry, "0xFFF0 + 0x20 wraps with carry", uart_ops);
}

bool test_add_sub24(ux8::hal::UARTDriverOps* uart_ops) {
    Uint24 a = Uint24::from_u32(0x00FFFF);
    Uint24 r = ux8::math::add24(a, Uint24{1, 0, 0});
    if (!expect(r.to_u32() == 0x010000, "carry ripples through mid byte", uart_ops)) return false;
    r = ux8::math::add24(Uint24::from_u32(0xFFFFFF), Uint24{1, 0, 0});
    if (!expect(r.to_u32() == 0, "overflow wraps to zero", uart_ops)) return false;
    r = ux8::math::sub24(Uint24::from_u32(0x010000), Uint24{1, 0, 0});
    if (!expect(r.to_u32() == 0x00FFFF, "borrow ripples through mid byte", uart_ops)) return false;
    r = ux8::math::sub24(Uint24{}, Uint24{1, 0, 0});
    return expect(r.to_u32() == 0xFFFFFF, "underflow wraps", uart_ops);
}

bool test_mul24(ux8::hal::UARTDriverOps* uart_ops) {
    Uint24 r = ux8::math::mul24_by_u8(Uint24::from_u32(86399), 60);
    if (!expect(r.to_u32() == 5183940, "86399 * 60", uart_ops)) return false;
    r = ux8::math::mul24_by_u8(Uint24::from_u32(1234), 0);
    return expect(r.to_u32() == 0, "times zero", uart_ops);
}

bool test_div24(ux8::hal::UARTDriverOps* uart_ops) {
    auto d = ux8::math::div24_by_u8(Uint24::from_u32(5183999), 60);
    if (!expect(d.quotient.to_u32() == 86399 && d.remainder == 59, "5183999 / 60", uart_ops)) return false;
    d = ux8::math::div24_by_u8(Uint24::from_u32(0xFFFFFF), 255);
    if (!expect(d.quotient.to_u32() == 0xFFFFFF / 255 && d.remainder == 0xFFFFFF % 255, "max / 255", uart_ops)) return false;
    d = ux8::math::div24_by_u8(Uint24::from_u32(0xFFFFFF), 200);
    if (!expect(d.quotient.to_u32() == 0xFFFFFF / 200 && d.remainder == 0xFFFFFF % 200,
                "partial remainder above 255", uart_ops)) return false;
    d = ux8::math::div24_by_u8(Uint24::from_u32(100), 0);
    return expect(d.quotient.to_u32() == 0xFFFFFF && d.remainder == 0, "division by zero", uart_ops);
}

bool test_less24(ux8::hal::UARTDriverOps* uart_ops) {
    if (!expect(ux8::math::less24(Uint24::from_u32(0x000010), Uint24::from_u32(0x00FFFF)), "0x10 < 0xFFFF", uart_ops)) return false;
    if (!expect(!ux8::math::less24(Uint24::from_u32(0x010000), Uint24::from_u32(0x00FFFF)), "high byte decides", uart_ops)) return false;
    return expect(!ux8::math::less24(Uint24::from_u32(0x1234), Uint24::from_u32(0x1234)), "equal is not less", uart_ops);
}

bool test_hms_to_seconds(ux8::hal::UARTDriverOps* uart_ops) {
    if (!expect(ux8::math::hms_to_seconds(1, 1, 1).to_u32() == 3661, "01:01:01", uart_ops)) return false;
    return expect(ux8::math::hms_to_seconds(23, 59, 59).to_u32() == 86399, "23:59:59 needs 17 bits", uart_ops);
}

} // namespace

void register_fixed_math_tests(TestFramework& tf) {
    tf.register_test({"math_add16", test_add16_carry, "16-bit add with carry out"});
    tf.register_test({"math_add_sub24", test_add_sub24, "24-bit add/subtract carry and borrow"});
    tf.register_test({"math_mul24", test_mul24, "Multiply by repeated addition"});
    tf.register_test({"math_div24", test_div24, "Restoring long division"});
    tf.register_test({"math_less24", test_less24, "Byte-wise 24-bit compare"});
    tf.register_test({"math_hms", test_hms_to_seconds, "H/M/S to seconds"});
}

} // namespace test
