#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file file_io.h
 * \brief Whole-file read mapping and replace-on-write helpers for tools and
 * bindings.
 */

namespace safemeta {

enum class FileIoStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    /// The file exceeds the caller's byte cap.
    TooLarge,
    MapFailed,
    /// The destination exists and overwriting was not requested.
    AlreadyExists,
    WriteFailed,
};

/**
 * \brief Read-only, whole-file memory mapping.
 *
 * Exposes the file as a `std::span<const std::byte>` so a batch of large
 * images can be stripped without copying every input into memory.
 */
class MappedFile final {
public:
    MappedFile() noexcept = default;
    ~MappedFile() noexcept;

    MappedFile(const MappedFile&)            = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;

    /// Maps \p path read-only. \p max_file_bytes is a hard cap (0 = unlimited).
    FileIoStatus open(const char* path, uint64_t max_file_bytes = 0) noexcept;

    /// Unmaps and closes the file (idempotent).
    void close() noexcept;

    bool is_open() const noexcept { return open_; }
    std::span<const std::byte> bytes() const noexcept
    {
        return size_ == 0U ? std::span<const std::byte> {}
                           : std::span<const std::byte>(data_, size_);
    }

private:
    void release() noexcept;
    void steal(MappedFile& other) noexcept;

#if defined(_WIN32)
    void* file_handle_ = nullptr;
    void* map_handle_  = nullptr;
#else
    int fd_ = -1;
#endif
    const std::byte* data_ = nullptr;
    size_t size_           = 0;
    bool open_             = false;
};

/**
 * \brief Writes \p bytes to \p path through a sibling temporary file.
 *
 * The destination is replaced only after the temporary file is complete, so
 * a failed write never leaves a truncated image behind. Without
 * \p overwrite an existing destination yields \ref FileIoStatus::AlreadyExists.
 */
FileIoStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes,
                 bool overwrite) noexcept;

/// True when \p path can be opened for reading.
bool
file_exists(const char* path) noexcept;

/// Returns a short, stable name ("ok", "open_failed", ...).
const char*
file_io_status_name(FileIoStatus status) noexcept;

}  // namespace safemeta
