#include "safemeta/container_payload.h"

#include "byte_io_internal.h"

#include <array>

#include <zlib.h>

namespace safemeta {
namespace {

    using byte_io::u8;

    static PayloadResult inflate_zlib(std::span<const std::byte> in,
                                      std::vector<std::byte>* out,
                                      const PayloadOptions& options) noexcept
    {
        PayloadResult res;

        z_stream strm {};
        strm.zalloc = Z_NULL;
        strm.zfree  = Z_NULL;
        strm.opaque = Z_NULL;

        int ret = inflateInit(&strm);
        if (ret != Z_OK) {
            res.status = PayloadStatus::Malformed;
            return res;
        }

        // PNG text chunks are small; feed the whole input at once when it fits.
        if (in.size() > static_cast<size_t>(0xFFFFFFFFU)) {
            (void)inflateEnd(&strm);
            res.status = PayloadStatus::LimitExceeded;
            return res;
        }
        strm.next_in  = reinterpret_cast<Bytef*>(
            const_cast<std::byte*>(in.data()));
        strm.avail_in = static_cast<uInt>(in.size());

        const uint64_t max_out = options.limits.max_output_bytes;
        std::array<std::byte, 16384> chunk {};

        for (;;) {
            strm.next_out  = reinterpret_cast<Bytef*>(chunk.data());
            strm.avail_out = static_cast<uInt>(chunk.size());

            ret                 = inflate(&strm, Z_NO_FLUSH);
            const size_t produced = chunk.size() - strm.avail_out;

            if (max_out != 0U && out->size() + produced > max_out) {
                (void)inflateEnd(&strm);
                res.status  = PayloadStatus::LimitExceeded;
                res.written = out->size();
                return res;
            }
            out->insert(out->end(), chunk.begin(),
                        chunk.begin() + static_cast<std::ptrdiff_t>(produced));

            if (ret == Z_STREAM_END) {
                break;
            }
            if (ret != Z_OK) {
                (void)inflateEnd(&strm);
                res.status  = PayloadStatus::Malformed;
                res.written = out->size();
                return res;
            }
            if (produced == 0 && strm.avail_in == 0) {
                // Truncated stream.
                (void)inflateEnd(&strm);
                res.status  = PayloadStatus::Malformed;
                res.written = out->size();
                return res;
            }
        }

        (void)inflateEnd(&strm);
        res.written = out->size();
        return res;
    }


    static int hex_value(uint8_t c) noexcept
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return 10 + (c - 'a');
        }
        if (c >= 'A' && c <= 'F') {
            return 10 + (c - 'A');
        }
        return -1;
    }


    static bool is_space(uint8_t c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

}  // namespace

PayloadResult
extract_payload(std::span<const std::byte> file_bytes,
                const ContainerBlockRef& block, std::vector<std::byte>* out,
                const PayloadOptions& options) noexcept
{
    PayloadResult res;
    if (!out) {
        res.status = PayloadStatus::Malformed;
        return res;
    }
    out->clear();
    if (block.data_offset > file_bytes.size()
        || block.data_size > file_bytes.size() - block.data_offset) {
        res.status = PayloadStatus::Malformed;
        return res;
    }
    const std::span<const std::byte> data
        = file_bytes.subspan(static_cast<size_t>(block.data_offset),
                             static_cast<size_t>(block.data_size));

    switch (block.compression) {
    case BlockCompression::None: {
        const uint64_t max_out = options.limits.max_output_bytes;
        if (max_out != 0U && data.size() > max_out) {
            res.status = PayloadStatus::LimitExceeded;
            return res;
        }
        out->assign(data.begin(), data.end());
        res.written = out->size();
        return res;
    }
    case BlockCompression::Deflate: return inflate_zlib(data, out, options);
    }
    res.status = PayloadStatus::Unsupported;
    return res;
}


PayloadResult
decode_raw_profile_text(std::span<const std::byte> text,
                        std::vector<std::byte>* out,
                        const PayloadOptions& options) noexcept
{
    PayloadResult res;
    if (!out) {
        res.status = PayloadStatus::Malformed;
        return res;
    }
    out->clear();

    // Skip the leading newline and profile name line.
    uint64_t p = 0;
    while (p < text.size() && u8(text[p]) == '\n') {
        p += 1;
    }
    while (p < text.size() && u8(text[p]) != '\n') {
        p += 1;
    }
    while (p < text.size() && is_space(u8(text[p]))) {
        p += 1;
    }

    uint64_t length = 0;
    bool has_digit  = false;
    while (p < text.size() && u8(text[p]) >= '0' && u8(text[p]) <= '9') {
        length = length * 10U + static_cast<uint64_t>(u8(text[p]) - '0');
        has_digit = true;
        p += 1;
        if (length > (1ULL << 40)) {
            res.status = PayloadStatus::Malformed;
            return res;
        }
    }
    if (!has_digit) {
        res.status = PayloadStatus::Malformed;
        return res;
    }
    const uint64_t max_out = options.limits.max_output_bytes;
    if (max_out != 0U && length > max_out) {
        res.status = PayloadStatus::LimitExceeded;
        return res;
    }
    if (length > (text.size() - p) / 2U) {
        res.status = PayloadStatus::Malformed;
        return res;
    }

    out->reserve(static_cast<size_t>(length));
    int hi = -1;
    while (p < text.size() && out->size() < length) {
        const uint8_t c = u8(text[p]);
        p += 1;
        if (is_space(c)) {
            continue;
        }
        const int v = hex_value(c);
        if (v < 0) {
            res.status  = PayloadStatus::Malformed;
            res.written = out->size();
            return res;
        }
        if (hi < 0) {
            hi = v;
        } else {
            out->push_back(std::byte { static_cast<uint8_t>((hi << 4) | v) });
            hi = -1;
        }
    }
    if (out->size() != length) {
        res.status = PayloadStatus::Malformed;
    }
    res.written = out->size();
    return res;
}


const char*
payload_status_name(PayloadStatus status) noexcept
{
    switch (status) {
    case PayloadStatus::Ok: return "ok";
    case PayloadStatus::Unsupported: return "unsupported";
    case PayloadStatus::Malformed: return "malformed";
    case PayloadStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace safemeta
