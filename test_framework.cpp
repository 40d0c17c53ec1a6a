// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file test_framework.cpp
 * @brief Unit test framework for ux8 v0.1.
 */

#include "test_framework.hpp"
#include "util.hpp"

namespace test {

void TestFramework::register_test(const TestCase& test) {
    tests_.push_back(test);
}

int TestFramework::run_all_tests(ux8::hal::UARTDriverOps* uart_ops) {
    if (!uart_ops) return -1;
    int failures = 0;
    uart_ops->puts("\nRunning ux8 Unit Tests\n");
    for (const auto& test : tests_) {
        uart_ops->puts("Test: ");
        uart_ops->puts(test.name.data());
        uart_ops->puts(" - ");
        uart_ops->puts(test.description.data());
        uart_ops->puts("... ");
        bool result = test.func(uart_ops);
        uart_ops->puts(result ? "PASSED" : "FAILED");
        uart_ops->puts("\n");
        if (!result) ++failures;
    }
    char buf[64];
    ux8::util::k_snprintf(buf, sizeof(buf), "\nTests completed: %u passed, %u failed\n",
                          static_cast<unsigned>(tests_.size() - static_cast<size_t>(failures)),
                          static_cast<unsigned>(failures));
    uart_ops->puts(buf);
    return failures;
}

bool expect(bool condition, const char* what, ux8::hal::UARTDriverOps* uart_ops) {
    if (!condition && uart_ops) {
        uart_ops->puts("\n  check failed: ");
        uart_ops->puts(what);
        uart_ops->puts("\n  ");
    }
    return condition;
}

} // namespace test
