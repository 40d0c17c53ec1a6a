// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file fs.hpp
 * @brief RAM file system subsystem header for ux8 v0.1.
 * @details
 * A fixed directory table of DIR_MAX packed 30-byte records in front of an append-only
 * content heap. Entries [0, count) are live and contiguous, the rest are zero. Removing
 * a file shifts the tail of the table down one record; heap bytes are never reclaimed.
 *
 * @version 0.1
 * @see fs.cpp, core.hpp
 */

#ifndef FS_HPP
#define FS_HPP

#include "core.hpp"
#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <cstdint>
#include <cstddef>

namespace ux8 {
namespace fs {

enum class FsStatus {
    OK,
    NOT_FOUND,
    DIRECTORY_FULL,
    HEAP_FULL,
    INVALID_NAME
};

using PaddedName = std::array<char, core::DIR_NAME_LEN>;

/// Metadata of one live entry, with NUL-terminated copies of the text fields.
struct FileInfo {
    std::array<char, core::DIR_NAME_LEN + 1> name{}; // trimmed at the first space
    uint16_t length = 0;
    uint16_t start = 0;
    std::array<char, core::DATE_LEN + 1> date{};
    std::array<char, core::TIME_LEN + 1> time{};
};

struct FileListing {
    std::array<FileInfo, core::DIR_MAX> entries{};
    size_t count = 0;
};

/**
 * @brief Builds the on-table form of a name: first DIR_NAME_LEN characters, space padded.
 * @return std::nullopt for an empty name.
 */
std::optional<PaddedName> make_padded_name(std::string_view name) noexcept;

const char* status_name(FsStatus status) noexcept;

class FileSystem {
public:
    FileSystem() = default;

    /// Empties the directory and rewinds the heap watermark to HEAP_BASE.
    void init() noexcept;

    /**
     * @brief Appends @p content at the heap watermark and records it in the next free slot.
     * @details Fails without touching any state when the name is empty, the table is full
     *          or the content would run past the end of the heap.
     */
    FsStatus create(std::string_view name, std::span<const uint8_t> content, const core::Timestamp& stamp) noexcept;

    /// Index of the first live entry whose padded name matches, first match wins.
    std::optional<size_t> find(std::string_view name) const noexcept;

    std::optional<std::span<const uint8_t>> read(std::string_view name) const noexcept;

    std::optional<FileInfo> stat(std::string_view name) const noexcept;

    FsStatus remove(std::string_view name) noexcept;

    /// Live entries in slot order, or std::nullopt when the directory is empty.
    std::optional<FileListing> list() const noexcept;

    size_t count() const noexcept { return count_; }
    uint16_t watermark() const noexcept { return watermark_; }
    uint32_t free_heap_bytes() const noexcept { return core::HEAP_END - watermark_; }

    /// Raw bytes of a directory slot (live or free).
    std::span<const uint8_t, core::DIR_ENTRY_SIZE> raw_entry(size_t slot) const noexcept;

private:
    uint8_t* entry_ptr(size_t slot) noexcept { return table_.data() + slot * core::DIR_ENTRY_SIZE; }
    const uint8_t* entry_ptr(size_t slot) const noexcept { return table_.data() + slot * core::DIR_ENTRY_SIZE; }
    FileInfo info_for(size_t slot) const noexcept;

    std::array<uint8_t, core::DIR_MAX * core::DIR_ENTRY_SIZE> table_{};
    std::array<uint8_t, core::HEAP_SIZE> heap_{};
    size_t count_ = 0;
    uint16_t watermark_ = core::HEAP_BASE;
};

extern FileSystem g_file_system;

} // namespace fs
} // namespace ux8

#endif // FS_HPP
