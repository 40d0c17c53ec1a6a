// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file core.hpp
 * @brief Core types and configuration constants for ux8 v0.1.
 * @details
 * Defines the compile-time configuration of the shell (directory geometry, heap window,
 * tick rates, buffer sizes) and the interrupt-masking critical section used while the
 * tick counter is primed. Designed to be dependency-free except for standard headers.
 *
 * @version 0.1
 * @see core.cpp, hal.hpp
 */

#ifndef CORE_HPP
#define CORE_HPP

#include <array>
#include <cstdint>
#include <cstddef>

namespace ux8 {
namespace hal { struct IRQControllerOps; }

namespace core {

// Directory table geometry
constexpr size_t DIR_MAX = 8;
constexpr size_t DIR_NAME_LEN = 8;

// Directory entry layout (fixed width, little-endian 16-bit fields)
constexpr size_t DIR_OFF_NAME = 0;
constexpr size_t DIR_OFF_START = 8;
constexpr size_t DIR_OFF_LEN = 10;
constexpr size_t DIR_OFF_DATE = 12;
constexpr size_t DIR_DATE_LEN = 10;
constexpr size_t DIR_OFF_TIME = 22;
constexpr size_t DIR_TIME_LEN = 8;
constexpr size_t DIR_ENTRY_SIZE = 30;
static_assert(DIR_OFF_TIME + DIR_TIME_LEN == DIR_ENTRY_SIZE, "directory entry layout must be packed");

// Content heap window (absolute addresses as seen by the user)
constexpr uint16_t HEAP_BASE = 0x6000;
constexpr uint32_t HEAP_SIZE = 0x4000;
constexpr uint32_t HEAP_END = HEAP_BASE + HEAP_SIZE;
static_assert(HEAP_END <= 0x10000, "heap must fit a 16-bit address space");

// Clock
constexpr uint8_t DEFAULT_TICKS_PER_SEC = 60; // NTSC
constexpr uint8_t PAL_TICKS_PER_SEC = 50;
constexpr uint32_t SECONDS_PER_DAY = 86400;
constexpr uint32_t TICK_MASK = 0xFFFFFF;

// Console / session buffers
constexpr size_t LINE_MAX = 40;
constexpr size_t USER_MAX = 16;  // includes terminator
constexpr size_t DATE_LEN = 10;  // "YYYY-MM-DD"
constexpr size_t TIME_LEN = 8;   // "HH:MM:SS"

/// Creation stamp carried by a directory entry: "YYYY-MM-DD" and "HH:MM:SS", unterminated.
struct Timestamp {
    std::array<char, DATE_LEN> date{};
    std::array<char, TIME_LEN> time{};
};

/**
 * @brief Masks the tick interrupt source for the lifetime of the guard.
 * @details Used once during session setup so the tick counter cannot move between
 *          priming it and seeding the rollover snapshot.
 */
class ScopedISRLock {
    hal::IRQControllerOps* irq_ops_;
public:
    explicit ScopedISRLock(hal::IRQControllerOps* irq_ops);
    ~ScopedISRLock();
    ScopedISRLock(const ScopedISRLock&) = delete;
    ScopedISRLock& operator=(const ScopedISRLock&) = delete;
};

} // namespace core
} // namespace ux8

#endif // CORE_HPP
