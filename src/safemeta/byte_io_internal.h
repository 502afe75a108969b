#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace safemeta {

// Internal-only (non-installed) byte readers and writers shared by the
// scanners, decoders and container writers.

namespace byte_io {

    constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    inline bool match(std::span<const std::byte> bytes, uint64_t offset,
                      const char* s, uint32_t s_len) noexcept
    {
        const uint64_t size = static_cast<uint64_t>(bytes.size());
        if (offset > size || s_len > size - offset) {
            return false;
        }
        return std::memcmp(bytes.data() + static_cast<size_t>(offset), s,
                           static_cast<size_t>(s_len))
               == 0;
    }


    inline bool read_u16be(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (offset > bytes.size() || bytes.size() - offset < 2) {
            return false;
        }
        *out = static_cast<uint16_t>((u8(bytes[offset + 0]) << 8)
                                     | (u8(bytes[offset + 1]) << 0));
        return true;
    }


    inline bool read_u16le(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (offset > bytes.size() || bytes.size() - offset < 2) {
            return false;
        }
        *out = static_cast<uint16_t>((u8(bytes[offset + 0]) << 0)
                                     | (u8(bytes[offset + 1]) << 8));
        return true;
    }


    inline bool read_u24le(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset > bytes.size() || bytes.size() - offset < 3) {
            return false;
        }
        *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 0)
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 16);
        return true;
    }


    inline bool read_u32be(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset > bytes.size() || bytes.size() - offset < 4) {
            return false;
        }
        *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
        return true;
    }


    inline bool read_u32le(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset > bytes.size() || bytes.size() - offset < 4) {
            return false;
        }
        *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 0)
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 16)
               | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 24);
        return true;
    }


    inline bool read_u64be(std::span<const std::byte> bytes, uint64_t offset,
                           uint64_t* out) noexcept
    {
        if (offset > bytes.size() || bytes.size() - offset < 8) {
            return false;
        }
        uint64_t v = 0;
        for (uint32_t i = 0; i < 8; ++i) {
            v = (v << 8) | static_cast<uint64_t>(u8(bytes[offset + i]));
        }
        *out = v;
        return true;
    }


    inline bool read_u64le(std::span<const std::byte> bytes, uint64_t offset,
                           uint64_t* out) noexcept
    {
        if (offset > bytes.size() || bytes.size() - offset < 8) {
            return false;
        }
        uint64_t v = 0;
        for (uint32_t i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(u8(bytes[offset + i])) << (i * 8);
        }
        *out = v;
        return true;
    }


    inline void append_bytes(std::vector<std::byte>* out,
                             std::span<const std::byte> bytes)
    {
        out->insert(out->end(), bytes.begin(), bytes.end());
    }


    inline void append_ascii(std::vector<std::byte>* out, const char* s,
                             uint32_t s_len)
    {
        for (uint32_t i = 0; i < s_len; ++i) {
            out->push_back(std::byte { static_cast<uint8_t>(s[i]) });
        }
    }


    inline void append_u16be(std::vector<std::byte>* out, uint16_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    }


    inline void append_u24le(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    }


    inline void append_u32be(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    }


    inline void append_u32le(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
    }


    inline void store_u32le(std::vector<std::byte>* out, size_t at,
                            uint32_t v) noexcept
    {
        (*out)[at + 0] = std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) };
        (*out)[at + 1] = std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) };
        (*out)[at + 2] = std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) };
        (*out)[at + 3] = std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) };
    }

}  // namespace byte_io
}  // namespace safemeta
