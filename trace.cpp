// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file trace.cpp
 * @brief Event tracing subsystem implementation for ux8 v0.1.
 */

#include "trace.hpp"
#include "ux8.hpp"
#include "util.hpp"

namespace ux8 {
namespace trace {

TraceManager g_trace_manager;

const char* event_type_name(EventType type) noexcept {
    switch (type) {
        case EventType::SHELL_START: return "START  ";
        case EventType::COMMAND: return "CMD    ";
        case EventType::FILE_CREATE: return "CREATE ";
        case EventType::FILE_DELETE: return "DELETE ";
        case EventType::CLOCK_SET: return "CLKSET ";
        case EventType::DAY_ROLLOVER: return "ROLLOVR";
        case EventType::ERROR: return "ERROR  ";
        default: return "UNKNOWN";
    }
}

bool TraceManager::record_event(EventType type, std::string_view name_sv, uint32_t value) noexcept {
    if (!enabled_) {
        return false;
    }

    size_t idx = buffer_idx_++ % MAX_TRACE_EVENTS;

    TraceEvent& current_event = buffer_[idx];
    current_event.timestamp_ticks = 0;
    if (g_platform && g_platform->get_timer_ops()) {
        current_event.timestamp_ticks = g_platform->get_timer_ops()->read_ticks();
    }
    current_event.type = type;
    size_t name_len = util::min(name_sv.length(), TRACE_NAME_LEN);
    util::kmemcpy(current_event.name.data(), name_sv.data(), name_len);
    current_event.name[name_len] = '\0';
    current_event.value = value;
    current_event.used = true;
    return true;
}

const TraceEvent* TraceManager::last_event() const noexcept {
    if (buffer_idx_ == 0) return nullptr;
    return &buffer_[(buffer_idx_ - 1) % MAX_TRACE_EVENTS];
}

void TraceManager::dump_trace(hal::UARTDriverOps* uart_ops) const {
    if (!uart_ops) return;

    if (buffer_idx_ == 0) {
        uart_ops->puts("Trace buffer empty\n");
        return;
    }

    uart_ops->puts("\n--- Trace Buffer ---\n");

    // Oldest surviving entry sits at the write index once the ring has wrapped.
    size_t start_idx = 0;
    size_t num_to_print = buffer_idx_;
    if (buffer_idx_ >= MAX_TRACE_EVENTS) {
        start_idx = buffer_idx_ % MAX_TRACE_EVENTS;
        num_to_print = MAX_TRACE_EVENTS;
    }

    for (size_t i = 0; i < num_to_print; ++i) {
        size_t actual_idx = (start_idx + i) % MAX_TRACE_EVENTS;
        const auto& event = buffer_[actual_idx];
        if (!event.used) continue;

        char line_buf[96];
        util::k_snprintf(line_buf, sizeof(line_buf), "[%u] T:%x %s %s V:%x\n",
                         static_cast<unsigned>(actual_idx),
                         static_cast<unsigned>(event.timestamp_ticks),
                         event_type_name(event.type),
                         event.name.data(),
                         static_cast<unsigned>(event.value));
        uart_ops->puts(line_buf);
    }

    uart_ops->puts("--- End Trace ---\n");
}

void TraceManager::clear_trace() noexcept {
    buffer_idx_ = 0;
    for (auto& event_entry : buffer_) {
        event_entry = TraceEvent{};
    }
}

} // namespace trace
} // namespace ux8
