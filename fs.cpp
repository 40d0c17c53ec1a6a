// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file fs.cpp
 * @brief RAM file system subsystem implementation for ux8 v0.1.
 * @details
 * Record layout (DIR_ENTRY_SIZE bytes):
 *   0..7   name, space padded
 *   8..9   start address, little-endian
 *   10..11 length, little-endian
 *   12..21 creation date
 *   22..29 creation time
 *
 * @version 0.1
 * @see fs.hpp, fixed_math.hpp, trace.hpp
 */

#include "fs.hpp"
#include "fixed_math.hpp"
#include "trace.hpp"
#include "util.hpp"

namespace ux8 {
namespace fs {

FileSystem g_file_system;

namespace {

uint16_t load_u16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

void store_u16(uint8_t* p, uint16_t v) noexcept {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>(v >> 8);
}

} // namespace

std::optional<PaddedName> make_padded_name(std::string_view name) noexcept {
    if (name.empty()) return std::nullopt;
    PaddedName padded;
    padded.fill(' ');
    size_t n = util::min(name.length(), core::DIR_NAME_LEN);
    util::kmemcpy(padded.data(), name.data(), n);
    return padded;
}

const char* status_name(FsStatus status) noexcept {
    switch (status) {
        case FsStatus::OK: return "OK";
        case FsStatus::NOT_FOUND: return "FILE NOT FOUND";
        case FsStatus::DIRECTORY_FULL: return "DIRECTORY IS FULL";
        case FsStatus::HEAP_FULL: return "HEAP IS FULL";
        case FsStatus::INVALID_NAME: return "INVALID NAME";
        default: return "UNKNOWN";
    }
}

void FileSystem::init() noexcept {
    table_.fill(0);
    count_ = 0;
    watermark_ = core::HEAP_BASE;
}

FsStatus FileSystem::create(std::string_view name, std::span<const uint8_t> content,
                            const core::Timestamp& stamp) noexcept {
    auto padded = make_padded_name(name);
    if (!padded) {
        return FsStatus::INVALID_NAME;
    }
    if (count_ >= core::DIR_MAX) {
        trace::g_trace_manager.record_event(trace::EventType::ERROR, name, static_cast<uint32_t>(FsStatus::DIRECTORY_FULL));
        return FsStatus::DIRECTORY_FULL;
    }

    bool carry = false;
    uint16_t new_watermark = 0;
    if (content.size() <= 0xFFFF) {
        new_watermark = math::add16(watermark_, static_cast<uint16_t>(content.size()), &carry);
    }
    if (content.size() > 0xFFFF || carry || new_watermark > core::HEAP_END) {
        trace::g_trace_manager.record_event(trace::EventType::ERROR, name, static_cast<uint32_t>(FsStatus::HEAP_FULL));
        return FsStatus::HEAP_FULL;
    }

    if (!content.empty()) {
        util::kmemcpy(heap_.data() + (watermark_ - core::HEAP_BASE), content.data(), content.size());
    }

    uint8_t* entry = entry_ptr(count_);
    util::kmemset(entry, 0, core::DIR_ENTRY_SIZE);
    util::kmemcpy(entry + core::DIR_OFF_NAME, padded->data(), core::DIR_NAME_LEN);
    store_u16(entry + core::DIR_OFF_START, watermark_);
    store_u16(entry + core::DIR_OFF_LEN, static_cast<uint16_t>(content.size()));
    util::kmemcpy(entry + core::DIR_OFF_DATE, stamp.date.data(), core::DIR_DATE_LEN);
    util::kmemcpy(entry + core::DIR_OFF_TIME, stamp.time.data(), core::DIR_TIME_LEN);

    watermark_ = new_watermark;
    ++count_;
    trace::g_trace_manager.record_event(trace::EventType::FILE_CREATE, name, static_cast<uint32_t>(content.size()));
    return FsStatus::OK;
}

std::optional<size_t> FileSystem::find(std::string_view name) const noexcept {
    auto padded = make_padded_name(name);
    if (!padded) return std::nullopt;
    for (size_t i = 0; i < count_; ++i) {
        if (util::kmemcmp(entry_ptr(i) + core::DIR_OFF_NAME, padded->data(), core::DIR_NAME_LEN) == 0) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::span<const uint8_t>> FileSystem::read(std::string_view name) const noexcept {
    auto idx = find(name);
    if (!idx) return std::nullopt;
    const uint8_t* entry = entry_ptr(*idx);
    uint16_t start = load_u16(entry + core::DIR_OFF_START);
    uint16_t length = load_u16(entry + core::DIR_OFF_LEN);
    return std::span<const uint8_t>(heap_.data() + (start - core::HEAP_BASE), length);
}

FileInfo FileSystem::info_for(size_t slot) const noexcept {
    const uint8_t* entry = entry_ptr(slot);
    FileInfo info;
    size_t name_len = 0;
    while (name_len < core::DIR_NAME_LEN && entry[core::DIR_OFF_NAME + name_len] != ' ') {
        info.name[name_len] = static_cast<char>(entry[core::DIR_OFF_NAME + name_len]);
        ++name_len;
    }
    info.name[name_len] = '\0';
    info.start = load_u16(entry + core::DIR_OFF_START);
    info.length = load_u16(entry + core::DIR_OFF_LEN);
    util::kmemcpy(info.date.data(), entry + core::DIR_OFF_DATE, core::DIR_DATE_LEN);
    info.date[core::DATE_LEN] = '\0';
    util::kmemcpy(info.time.data(), entry + core::DIR_OFF_TIME, core::DIR_TIME_LEN);
    info.time[core::TIME_LEN] = '\0';
    return info;
}

std::optional<FileInfo> FileSystem::stat(std::string_view name) const noexcept {
    auto idx = find(name);
    if (!idx) return std::nullopt;
    return info_for(*idx);
}

FsStatus FileSystem::remove(std::string_view name) noexcept {
    auto idx = find(name);
    if (!idx) {
        return FsStatus::NOT_FOUND;
    }

    // Close the gap: copy the tail down one record, lowest address first.
    uint8_t* dst = entry_ptr(*idx);
    const uint8_t* src = dst + core::DIR_ENTRY_SIZE;
    size_t tail_bytes = (count_ - *idx - 1) * core::DIR_ENTRY_SIZE;
    for (size_t i = 0; i < tail_bytes; ++i) {
        dst[i] = src[i];
    }

    --count_;
    util::kmemset(entry_ptr(count_), 0, core::DIR_ENTRY_SIZE);
    trace::g_trace_manager.record_event(trace::EventType::FILE_DELETE, name, static_cast<uint32_t>(*idx));
    return FsStatus::OK;
}

std::optional<FileListing> FileSystem::list() const noexcept {
    if (count_ == 0) return std::nullopt;
    FileListing listing;
    for (size_t i = 0; i < count_; ++i) {
        listing.entries[i] = info_for(i);
    }
    listing.count = count_;
    return listing;
}

std::span<const uint8_t, core::DIR_ENTRY_SIZE> FileSystem::raw_entry(size_t slot) const noexcept {
    if (slot >= core::DIR_MAX) slot = core::DIR_MAX - 1;
    return std::span<const uint8_t, core::DIR_ENTRY_SIZE>(entry_ptr(slot), core::DIR_ENTRY_SIZE);
}

} // namespace fs
} // namespace ux8
