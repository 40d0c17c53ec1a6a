// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file trace.hpp
 * @brief Event tracing subsystem header for ux8 v0.1.
 * @details
 * Defines a lightweight tracing system for diagnosing shell activity. Records events
 * (command dispatch, file creation/removal, clock priming, day rollover, reported errors)
 * in a fixed-size ring buffer stamped with the raw tick counter, with support for
 * enabling/disabling, dumping to a UART and clearing.
 *
 * @version 0.1
 * @see trace.cpp, hal.hpp
 */

#ifndef TRACE_HPP
#define TRACE_HPP

#include "hal.hpp"
#include <array>
#include <string_view>
#include <cstdint>
#include <cstddef>

namespace ux8 {
namespace trace {

constexpr size_t MAX_TRACE_EVENTS = 64;
constexpr size_t TRACE_NAME_LEN = 16;

enum class EventType {
    SHELL_START,
    COMMAND,
    FILE_CREATE,
    FILE_DELETE,
    CLOCK_SET,
    DAY_ROLLOVER,
    ERROR
};

struct TraceEvent {
    uint32_t timestamp_ticks = 0;
    EventType type = EventType::SHELL_START;
    std::array<char, TRACE_NAME_LEN + 1> name{}; // copied, callers often pass line buffers
    uint32_t value = 0;
    bool used = false;
};

class TraceManager {
public:
    TraceManager() = default;

    void init() noexcept { clear_trace(); }

    void set_enabled(bool enable) noexcept { enabled_ = enable; }

    bool is_enabled() const noexcept { return enabled_; }

    bool record_event(EventType type, std::string_view name, uint32_t value = 0) noexcept;

    void dump_trace(hal::UARTDriverOps* uart_ops) const;

    void clear_trace() noexcept;

    /// Number of events recorded since the last clear (may exceed the buffer size).
    size_t recorded_count() const noexcept { return buffer_idx_; }

    /// Most recent event, or nullptr when nothing has been recorded.
    const TraceEvent* last_event() const noexcept;

private:
    bool enabled_ = false;
    std::array<TraceEvent, MAX_TRACE_EVENTS> buffer_{};
    size_t buffer_idx_ = 0;
};

extern TraceManager g_trace_manager;

const char* event_type_name(EventType type) noexcept;

} // namespace trace
} // namespace ux8

#endif // TRACE_HPP
