#include "safemeta/file_io.h"

#include <cstdio>
#include <limits>
#include <string>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace safemeta {

MappedFile::~MappedFile() noexcept
{
    close();
}


MappedFile::MappedFile(MappedFile&& other) noexcept
{
    steal(other);
}


MappedFile&
MappedFile::operator=(MappedFile&& other) noexcept
{
    if (this != &other) {
        close();
        steal(other);
    }
    return *this;
}


void
MappedFile::steal(MappedFile& other) noexcept
{
#if defined(_WIN32)
    file_handle_       = other.file_handle_;
    map_handle_        = other.map_handle_;
    other.file_handle_ = nullptr;
    other.map_handle_  = nullptr;
#else
    fd_       = other.fd_;
    other.fd_ = -1;
#endif
    data_       = other.data_;
    size_       = other.size_;
    open_       = other.open_;
    other.data_ = nullptr;
    other.size_ = 0;
    other.open_ = false;
}


FileIoStatus
MappedFile::open(const char* path, uint64_t max_file_bytes) noexcept
{
    close();
    if (!path || !*path) {
        return FileIoStatus::OpenFailed;
    }

#if defined(_WIN32)
    HANDLE h = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr,
                             OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return FileIoStatus::OpenFailed;
    }
    file_handle_ = static_cast<void*>(h);

    LARGE_INTEGER sz;
    if (!::GetFileSizeEx(h, &sz) || sz.QuadPart < 0) {
        release();
        return FileIoStatus::StatFailed;
    }
    const uint64_t file_size = static_cast<uint64_t>(sz.QuadPart);
#else
    fd_ = ::open(path, O_RDONLY);
    if (fd_ < 0) {
        return FileIoStatus::OpenFailed;
    }

    struct stat st {};
    if (::fstat(fd_, &st) != 0 || st.st_size < 0) {
        release();
        return FileIoStatus::StatFailed;
    }
    const uint64_t file_size = static_cast<uint64_t>(st.st_size);
#endif

    if ((max_file_bytes != 0U && file_size > max_file_bytes)
        || file_size > static_cast<uint64_t>(
               std::numeric_limits<size_t>::max())) {
        release();
        return FileIoStatus::TooLarge;
    }

    if (file_size != 0U) {
#if defined(_WIN32)
        HANDLE map = ::CreateFileMappingA(h, nullptr, PAGE_READONLY, 0, 0,
                                          nullptr);
        if (!map) {
            release();
            return FileIoStatus::MapFailed;
        }
        map_handle_ = static_cast<void*>(map);
        void* p     = ::MapViewOfFile(map, FILE_MAP_READ, 0, 0, 0);
#else
        void* p = ::mmap(nullptr, static_cast<size_t>(file_size), PROT_READ,
                         MAP_PRIVATE, fd_, 0);
        if (p == MAP_FAILED) {
            p = nullptr;
        }
#endif
        if (!p) {
            release();
            return FileIoStatus::MapFailed;
        }
        data_ = static_cast<const std::byte*>(p);
        size_ = static_cast<size_t>(file_size);
    }

    open_ = true;
    return FileIoStatus::Ok;
}


void
MappedFile::close() noexcept
{
    release();
}


void
MappedFile::release() noexcept
{
#if defined(_WIN32)
    if (data_) {
        ::UnmapViewOfFile(const_cast<void*>(static_cast<const void*>(data_)));
    }
    if (map_handle_) {
        ::CloseHandle(static_cast<HANDLE>(map_handle_));
    }
    if (file_handle_) {
        ::CloseHandle(static_cast<HANDLE>(file_handle_));
    }
    file_handle_ = nullptr;
    map_handle_  = nullptr;
#else
    if (data_ && size_ != 0U) {
        (void)::munmap(const_cast<void*>(static_cast<const void*>(data_)),
                       size_);
    }
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_ = -1;
#endif
    data_ = nullptr;
    size_ = 0;
    open_ = false;
}


bool
file_exists(const char* path) noexcept
{
    if (!path || !*path) {
        return false;
    }
    std::FILE* f = std::fopen(path, "rb");
    if (!f) {
        return false;
    }
    std::fclose(f);
    return true;
}


FileIoStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes,
                 bool overwrite) noexcept
{
    if (!path || !*path) {
        return FileIoStatus::OpenFailed;
    }
    if (!overwrite && file_exists(path)) {
        return FileIoStatus::AlreadyExists;
    }

    std::string tmp(path);
    tmp.append(".tmp");

    std::FILE* f = std::fopen(tmp.c_str(), "wb");
    if (!f) {
        return FileIoStatus::OpenFailed;
    }
    size_t written = 0;
    if (!bytes.empty()) {
        written = std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
    const bool closed = std::fclose(f) == 0;
    if (written != bytes.size() || !closed) {
        (void)std::remove(tmp.c_str());
        return FileIoStatus::WriteFailed;
    }

#if defined(_WIN32)
    // rename() does not replace an existing file on Windows.
    if (overwrite) {
        (void)std::remove(path);
    }
#endif
    if (std::rename(tmp.c_str(), path) != 0) {
        (void)std::remove(tmp.c_str());
        return FileIoStatus::WriteFailed;
    }
    return FileIoStatus::Ok;
}


const char*
file_io_status_name(FileIoStatus status) noexcept
{
    switch (status) {
    case FileIoStatus::Ok: return "ok";
    case FileIoStatus::OpenFailed: return "open_failed";
    case FileIoStatus::StatFailed: return "stat_failed";
    case FileIoStatus::TooLarge: return "too_large";
    case FileIoStatus::MapFailed: return "map_failed";
    case FileIoStatus::AlreadyExists: return "already_exists";
    case FileIoStatus::WriteFailed: return "write_failed";
    }
    return "unknown";
}

}  // namespace safemeta
