#include "safemeta/container_scan.h"

#include "byte_io_internal.h"

#include <array>

namespace safemeta {
namespace {

    using byte_io::match;
    using byte_io::read_u16be;
    using byte_io::read_u16le;
    using byte_io::read_u24le;
    using byte_io::read_u32be;
    using byte_io::read_u32le;
    using byte_io::u8;

    static constexpr uint32_t kPngSignatureSize = 8;
    static constexpr std::array<uint8_t, kPngSignatureSize> kPngSignature = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
    };

    struct BlockSink final {
        ContainerBlockRef* out = nullptr;
        uint32_t cap           = 0;
        ScanResult result;
    };

    static bool has_png_signature(std::span<const std::byte> bytes) noexcept
    {
        if (bytes.size() < kPngSignatureSize) {
            return false;
        }
        for (uint32_t i = 0; i < kPngSignatureSize; ++i) {
            if (u8(bytes[i]) != kPngSignature[i]) {
                return false;
            }
        }
        return true;
    }


    static void sink_emit(BlockSink* sink,
                          const ContainerBlockRef& block) noexcept
    {
        sink->result.needed += 1;
        if (sink->result.written < sink->cap) {
            sink->out[sink->result.written] = block;
            sink->result.written += 1;
        } else if (sink->result.status == ScanStatus::Ok) {
            sink->result.status = ScanStatus::OutputTruncated;
        }
    }


    static bool tiff_header_at(std::span<const std::byte> bytes,
                               uint64_t offset) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        const uint8_t a = u8(bytes[offset + 0]);
        const uint8_t b = u8(bytes[offset + 1]);
        const uint8_t c = u8(bytes[offset + 2]);
        const uint8_t d = u8(bytes[offset + 3]);
        return (a == 'I' && b == 'I' && (c == 0x2A || c == 0x2B) && d == 0x00)
               || (a == 'M' && b == 'M' && c == 0x00
                   && (d == 0x2A || d == 0x2B));
    }


    static void skip_exif_preamble(ContainerBlockRef* block,
                                   std::span<const std::byte> bytes) noexcept
    {
        // "Exif\0\0" precedes the TIFF header in JPEG APP1 and in some WebP
        // EXIF chunks. A non-zero second terminator byte is accepted when the
        // TIFF header follows.
        if (block->data_size < 10) {
            return;
        }
        if (!match(bytes, block->data_offset, "Exif", 4)
            || u8(bytes[block->data_offset + 4]) != 0) {
            return;
        }
        if (!tiff_header_at(bytes, block->data_offset + 6)) {
            return;
        }
        block->data_offset += 6;
        block->data_size -= 6;
    }


    static bool is_jpeg_sof(uint8_t marker_lo) noexcept
    {
        return marker_lo >= 0xC0 && marker_lo <= 0xCF && marker_lo != 0xC4
               && marker_lo != 0xC8 && marker_lo != 0xCC;
    }


    // Returns the offset of the first marker after entropy-coded data that
    // starts at `offset`, or bytes.size() when the data runs to the end.
    static uint64_t skip_jpeg_entropy(std::span<const std::byte> bytes,
                                      uint64_t offset) noexcept
    {
        uint64_t p = offset;
        while (p + 1 < bytes.size()) {
            if (u8(bytes[p]) != 0xFF) {
                p += 1;
                continue;
            }
            const uint8_t next = u8(bytes[p + 1]);
            if (next == 0x00 || (next >= 0xD0 && next <= 0xD7)) {
                p += 2;
                continue;
            }
            if (next == 0xFF) {
                p += 1;
                continue;
            }
            return p;
        }
        return static_cast<uint64_t>(bytes.size());
    }


    static ContainerBlockKind jpeg_app_kind(std::span<const std::byte> bytes,
                                            uint8_t marker_lo,
                                            uint64_t payload_off,
                                            uint64_t payload_size,
                                            uint64_t* skip) noexcept
    {
        *skip = 0;
        if (marker_lo == 0xE1) {
            if (payload_size >= 10 && match(bytes, payload_off, "Exif", 4)
                && u8(bytes[payload_off + 4]) == 0) {
                return ContainerBlockKind::Exif;
            }
            if (match(bytes, payload_off, "http://ns.adobe.com/xap/1.0/\0",
                      29)) {
                *skip = 29;
                return ContainerBlockKind::Xmp;
            }
            if (match(bytes, payload_off,
                      "http://ns.adobe.com/xmp/extension/\0", 35)) {
                *skip = (payload_size >= 35 + 32 + 8) ? (35 + 32 + 8) : 35;
                return ContainerBlockKind::XmpExtended;
            }
        } else if (marker_lo == 0xE2) {
            if (payload_size >= 14
                && match(bytes, payload_off, "ICC_PROFILE\0", 12)) {
                *skip = 14;
                return ContainerBlockKind::Icc;
            }
            if (match(bytes, payload_off, "MPF\0", 4)) {
                *skip = 4;
                return ContainerBlockKind::Mpf;
            }
        } else if (marker_lo == 0xED) {
            if (match(bytes, payload_off, "Photoshop 3.0\0", 14)) {
                *skip = 14;
                return ContainerBlockKind::PhotoshopIrb;
            }
        } else if (marker_lo == 0xFE) {
            return ContainerBlockKind::Comment;
        }
        return ContainerBlockKind::Vendor;
    }


    static bool png_keyword_is(std::span<const std::byte> bytes,
                               uint64_t keyword_off, uint64_t keyword_len,
                               const char* s, uint32_t s_len) noexcept
    {
        return keyword_len == s_len && match(bytes, keyword_off, s, s_len);
    }


    static ContainerBlockKind
    png_text_kind(std::span<const std::byte> bytes, uint64_t keyword_off,
                  uint64_t keyword_len) noexcept
    {
        if (png_keyword_is(bytes, keyword_off, keyword_len,
                           "XML:com.adobe.xmp", 17)) {
            return ContainerBlockKind::Xmp;
        }
        if (png_keyword_is(bytes, keyword_off, keyword_len,
                           "Raw profile type exif", 21)
            || png_keyword_is(bytes, keyword_off, keyword_len,
                              "Raw profile type APP1", 21)) {
            return ContainerBlockKind::RawProfileExif;
        }
        if (png_keyword_is(bytes, keyword_off, keyword_len,
                           "Raw profile type iptc", 21)
            || png_keyword_is(bytes, keyword_off, keyword_len,
                              "Raw profile type 8bim", 21)) {
            return ContainerBlockKind::RawProfileIptc;
        }
        return ContainerBlockKind::Text;
    }


    static bool png_is_image_chunk(uint32_t type) noexcept
    {
        return type == fourcc('I', 'H', 'D', 'R')
               || type == fourcc('P', 'L', 'T', 'E')
               || type == fourcc('t', 'R', 'N', 'S')
               || type == fourcc('I', 'D', 'A', 'T')
               || type == fourcc('I', 'E', 'N', 'D');
    }


    static bool webp_is_image_chunk(uint32_t type) noexcept
    {
        return type == fourcc('V', 'P', '8', ' ')
               || type == fourcc('V', 'P', '8', 'L')
               || type == fourcc('V', 'P', '8', 'X')
               || type == fourcc('A', 'L', 'P', 'H')
               || type == fourcc('A', 'N', 'I', 'M')
               || type == fourcc('A', 'N', 'M', 'F');
    }


    static bool bmff_brand(uint32_t brand, bool* is_heif,
                           bool* is_avif) noexcept
    {
        if (brand == fourcc('a', 'v', 'i', 'f')
            || brand == fourcc('a', 'v', 'i', 's')) {
            *is_avif = true;
            return true;
        }
        if (brand == fourcc('m', 'i', 'f', '1')
            || brand == fourcc('m', 's', 'f', '1')
            || brand == fourcc('h', 'e', 'i', 'c')
            || brand == fourcc('h', 'e', 'i', 'x')
            || brand == fourcc('h', 'e', 'v', 'c')
            || brand == fourcc('h', 'e', 'v', 'x')) {
            *is_heif = true;
            return true;
        }
        return false;
    }


    static ContainerFormat
    bmff_format_from_ftyp(std::span<const std::byte> bytes) noexcept
    {
        uint32_t size = 0;
        uint32_t type = 0;
        if (!read_u32be(bytes, 0, &size) || !read_u32be(bytes, 4, &type)
            || type != fourcc('f', 't', 'y', 'p') || size < 16) {
            return ContainerFormat::Unknown;
        }
        const uint64_t end = (size < bytes.size())
                                 ? static_cast<uint64_t>(size)
                                 : static_cast<uint64_t>(bytes.size());
        bool is_heif = false;
        bool is_avif = false;
        uint32_t major = 0;
        if (read_u32be(bytes, 8, &major)) {
            (void)bmff_brand(major, &is_heif, &is_avif);
        }
        for (uint64_t off = 16; off + 4 <= end; off += 4) {
            uint32_t brand = 0;
            if (!read_u32be(bytes, off, &brand)) {
                break;
            }
            (void)bmff_brand(brand, &is_heif, &is_avif);
        }
        if (is_avif) {
            return ContainerFormat::Avif;
        }
        if (is_heif) {
            return ContainerFormat::Heif;
        }
        return ContainerFormat::Unknown;
    }


    static bool read_jpeg_pixel_header(std::span<const std::byte> bytes,
                                       PixelHeader* out) noexcept
    {
        uint64_t offset = 2;
        while (offset + 4 <= bytes.size()) {
            if (u8(bytes[offset]) != 0xFF) {
                return false;
            }
            while (offset < bytes.size() && u8(bytes[offset]) == 0xFF) {
                offset += 1;
            }
            if (offset >= bytes.size()) {
                return false;
            }
            const uint8_t marker_lo = u8(bytes[offset]);
            offset += 1;
            if (marker_lo == 0xD9 || marker_lo == 0xDA) {
                return false;
            }
            if ((marker_lo >= 0xD0 && marker_lo <= 0xD7) || marker_lo == 0x01) {
                continue;
            }
            uint16_t seg_len = 0;
            if (!read_u16be(bytes, offset, &seg_len) || seg_len < 2) {
                return false;
            }
            if (is_jpeg_sof(marker_lo)) {
                uint16_t height = 0;
                uint16_t width  = 0;
                if (seg_len < 8 || !read_u16be(bytes, offset + 3, &height)
                    || !read_u16be(bytes, offset + 5, &width)
                    || offset + 7 >= bytes.size()) {
                    return false;
                }
                if (width == 0 || height == 0) {
                    return false;
                }
                const uint8_t components = u8(bytes[offset + 7]);
                out->width               = width;
                out->height              = height;
                out->has_alpha           = false;
                switch (components) {
                case 1: out->color_model = ColorModel::Gray; break;
                case 3: out->color_model = ColorModel::Rgb; break;
                case 4: out->color_model = ColorModel::Cmyk; break;
                default: out->color_model = ColorModel::Unknown; break;
                }
                return true;
            }
            offset += seg_len;
        }
        return false;
    }


    static bool read_png_pixel_header(std::span<const std::byte> bytes,
                                      PixelHeader* out) noexcept
    {
        uint32_t len    = 0;
        uint32_t type   = 0;
        uint32_t width  = 0;
        uint32_t height = 0;
        if (!read_u32be(bytes, 8, &len) || !read_u32be(bytes, 12, &type)
            || type != fourcc('I', 'H', 'D', 'R') || len < 13
            || !read_u32be(bytes, 16, &width)
            || !read_u32be(bytes, 20, &height) || bytes.size() < 26) {
            return false;
        }
        if (width == 0 || height == 0) {
            return false;
        }
        const uint8_t color_type = u8(bytes[25]);
        out->width               = width;
        out->height              = height;
        out->has_alpha           = (color_type == 4 || color_type == 6);
        switch (color_type) {
        case 0:
        case 4: out->color_model = ColorModel::Gray; break;
        case 2:
        case 3:
        case 6: out->color_model = ColorModel::Rgb; break;
        default: out->color_model = ColorModel::Unknown; break;
        }
        return true;
    }


    static bool read_webp_pixel_header(std::span<const std::byte> bytes,
                                       PixelHeader* out) noexcept
    {
        uint32_t type = 0;
        uint32_t size = 0;
        if (!read_u32be(bytes, 12, &type) || !read_u32le(bytes, 16, &size)) {
            return false;
        }
        const uint64_t payload = 20;
        if (size > bytes.size() - payload) {
            return false;
        }
        if (type == fourcc('V', 'P', '8', 'X')) {
            uint32_t w_minus_1 = 0;
            uint32_t h_minus_1 = 0;
            if (size < 10 || !read_u24le(bytes, payload + 4, &w_minus_1)
                || !read_u24le(bytes, payload + 7, &h_minus_1)) {
                return false;
            }
            out->width       = w_minus_1 + 1U;
            out->height      = h_minus_1 + 1U;
            out->has_alpha   = (u8(bytes[payload]) & 0x10U) != 0;
            out->color_model = ColorModel::Rgb;
            return true;
        }
        if (type == fourcc('V', 'P', '8', ' ')) {
            uint16_t w = 0;
            uint16_t h = 0;
            if (size < 10 || !match(bytes, payload + 3, "\x9D\x01\x2A", 3)
                || !read_u16le(bytes, payload + 6, &w)
                || !read_u16le(bytes, payload + 8, &h)) {
                return false;
            }
            out->width       = w & 0x3FFFU;
            out->height      = h & 0x3FFFU;
            out->has_alpha   = false;
            out->color_model = ColorModel::Rgb;
            return out->width != 0 && out->height != 0;
        }
        if (type == fourcc('V', 'P', '8', 'L')) {
            uint32_t bits = 0;
            if (size < 5 || !match(bytes, payload, "\x2F", 1)
                || !read_u32le(bytes, payload + 1, &bits)) {
                return false;
            }
            out->width       = (bits & 0x3FFFU) + 1U;
            out->height      = ((bits >> 14) & 0x3FFFU) + 1U;
            out->has_alpha   = ((bits >> 28) & 1U) != 0;
            out->color_model = ColorModel::Rgb;
            return true;
        }
        return false;
    }

}  // namespace

ContainerFormat
detect_format(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() >= 3 && u8(bytes[0]) == 0xFF && u8(bytes[1]) == 0xD8
        && u8(bytes[2]) == 0xFF) {
        return ContainerFormat::Jpeg;
    }
    if (has_png_signature(bytes)) {
        return ContainerFormat::Png;
    }
    if (bytes.size() >= 12 && match(bytes, 0, "RIFF", 4)
        && match(bytes, 8, "WEBP", 4)) {
        return ContainerFormat::Webp;
    }
    if (match(bytes, 0, "GIF87a", 6) || match(bytes, 0, "GIF89a", 6)) {
        return ContainerFormat::Gif;
    }
    if (tiff_header_at(bytes, 0)) {
        return ContainerFormat::Tiff;
    }
    return bmff_format_from_ftyp(bytes);
}


const char*
scan_status_name(ScanStatus status) noexcept
{
    switch (status) {
    case ScanStatus::Ok: return "ok";
    case ScanStatus::OutputTruncated: return "output_truncated";
    case ScanStatus::Unsupported: return "unsupported";
    case ScanStatus::Malformed: return "malformed";
    }
    return "unknown";
}


const char*
container_format_name(ContainerFormat format) noexcept
{
    switch (format) {
    case ContainerFormat::Unknown: return "unknown";
    case ContainerFormat::Jpeg: return "jpeg";
    case ContainerFormat::Png: return "png";
    case ContainerFormat::Webp: return "webp";
    case ContainerFormat::Gif: return "gif";
    case ContainerFormat::Tiff: return "tiff";
    case ContainerFormat::Heif: return "heif";
    case ContainerFormat::Avif: return "avif";
    }
    return "unknown";
}


const char*
container_block_kind_name(ContainerBlockKind kind) noexcept
{
    switch (kind) {
    case ContainerBlockKind::Unknown: return "unknown";
    case ContainerBlockKind::Exif: return "exif";
    case ContainerBlockKind::Xmp: return "xmp";
    case ContainerBlockKind::XmpExtended: return "xmp_extended";
    case ContainerBlockKind::Icc: return "icc";
    case ContainerBlockKind::IptcIim: return "iptc_iim";
    case ContainerBlockKind::PhotoshopIrb: return "photoshop_irb";
    case ContainerBlockKind::Mpf: return "mpf";
    case ContainerBlockKind::Comment: return "comment";
    case ContainerBlockKind::Text: return "text";
    case ContainerBlockKind::RawProfileExif: return "raw_profile_exif";
    case ContainerBlockKind::RawProfileIptc: return "raw_profile_iptc";
    case ContainerBlockKind::Vendor: return "vendor";
    }
    return "unknown";
}


ScanResult
scan_jpeg(std::span<const std::byte> bytes,
          std::span<ContainerBlockRef> out) noexcept
{
    BlockSink sink;
    sink.out = out.data();
    sink.cap = static_cast<uint32_t>(out.size());

    if (bytes.size() < 2) {
        sink.result.status = ScanStatus::Malformed;
        return sink.result;
    }
    if (u8(bytes[0]) != 0xFF || u8(bytes[1]) != 0xD8) {
        sink.result.status = ScanStatus::Unsupported;
        return sink.result;
    }

    uint64_t offset = 2;
    while (offset + 2 <= bytes.size()) {
        if (u8(bytes[offset]) != 0xFF) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }
        while (offset < bytes.size() && u8(bytes[offset]) == 0xFF) {
            offset += 1;
        }
        if (offset >= bytes.size()) {
            break;
        }
        const uint64_t marker_off = offset - 1;
        const uint8_t marker_lo   = u8(bytes[offset]);
        offset += 1;

        if (marker_lo == 0xD9) {
            break;
        }
        if ((marker_lo >= 0xD0 && marker_lo <= 0xD7) || marker_lo == 0x01) {
            continue;
        }

        uint16_t seg_len = 0;
        if (!read_u16be(bytes, offset, &seg_len) || seg_len < 2) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }
        const uint64_t payload_off  = offset + 2;
        const uint64_t payload_size = static_cast<uint64_t>(seg_len - 2);
        if (payload_off + payload_size > bytes.size()) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }

        const bool is_app = (marker_lo >= 0xE0 && marker_lo <= 0xEF);
        const bool is_adobe = (marker_lo == 0xEE)
                              && match(bytes, payload_off, "Adobe", 5);
        if ((is_app && !is_adobe) || marker_lo == 0xFE) {
            uint64_t skip = 0;
            ContainerBlockRef block;
            block.format = ContainerFormat::Jpeg;
            block.kind   = jpeg_app_kind(bytes, marker_lo, payload_off,
                                         payload_size, &skip);
            block.outer_offset = marker_off;
            block.outer_size   = 2 + static_cast<uint64_t>(seg_len);
            block.data_offset  = payload_off + skip;
            block.data_size    = payload_size - skip;
            block.id = static_cast<uint32_t>(0xFF00U | marker_lo);
            if (block.kind == ContainerBlockKind::Exif) {
                skip_exif_preamble(&block, bytes);
            }
            sink_emit(&sink, block);
        }

        offset = payload_off + payload_size;
        if (marker_lo == 0xDA) {
            offset = skip_jpeg_entropy(bytes, offset);
        }
    }

    return sink.result;
}


ScanResult
scan_png(std::span<const std::byte> bytes,
         std::span<ContainerBlockRef> out) noexcept
{
    BlockSink sink;
    sink.out = out.data();
    sink.cap = static_cast<uint32_t>(out.size());

    if (bytes.size() < kPngSignatureSize) {
        sink.result.status = ScanStatus::Malformed;
        return sink.result;
    }
    if (!has_png_signature(bytes)) {
        sink.result.status = ScanStatus::Unsupported;
        return sink.result;
    }

    uint64_t offset = kPngSignatureSize;
    while (offset + 12 <= bytes.size()) {
        const uint64_t chunk_off = offset;
        uint32_t len             = 0;
        uint32_t type            = 0;
        if (!read_u32be(bytes, offset, &len)
            || !read_u32be(bytes, offset + 4, &type)) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }
        const uint64_t data_off   = offset + 8;
        const uint64_t data_size  = static_cast<uint64_t>(len);
        const uint64_t end        = data_off + data_size;
        const uint64_t chunk_size = 12 + data_size;
        if (end + 4 > bytes.size()) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }

        if (!png_is_image_chunk(type)) {
            ContainerBlockRef block;
            block.format       = ContainerFormat::Png;
            block.kind         = ContainerBlockKind::Vendor;
            block.outer_offset = chunk_off;
            block.outer_size   = chunk_size;
            block.data_offset  = data_off;
            block.data_size    = data_size;
            block.id           = type;

            uint64_t keyword_end = data_off;
            while (keyword_end < end && u8(bytes[keyword_end]) != 0) {
                keyword_end += 1;
            }
            const uint64_t keyword_len = keyword_end - data_off;

            if (type == fourcc('e', 'X', 'I', 'f')) {
                block.kind = ContainerBlockKind::Exif;
                skip_exif_preamble(&block, bytes);
            } else if (type == fourcc('i', 'C', 'C', 'P')) {
                // profile_name\0 + compression_method + compressed_profile
                block.kind = ContainerBlockKind::Icc;
                if (keyword_end + 2 <= end) {
                    block.compression = BlockCompression::Deflate;
                    block.data_offset = keyword_end + 2;
                    block.data_size   = end - (keyword_end + 2);
                }
            } else if (type == fourcc('t', 'E', 'X', 't')) {
                // keyword\0 + text
                block.kind = png_text_kind(bytes, data_off, keyword_len);
                if (keyword_end < end) {
                    block.data_offset = keyword_end + 1;
                    block.data_size   = end - (keyword_end + 1);
                }
            } else if (type == fourcc('z', 'T', 'X', 't')) {
                // keyword\0 + comp_method + compressed_text
                block.kind = png_text_kind(bytes, data_off, keyword_len);
                if (keyword_end + 2 <= end) {
                    block.compression = BlockCompression::Deflate;
                    block.data_offset = keyword_end + 2;
                    block.data_size   = end - (keyword_end + 2);
                }
            } else if (type == fourcc('i', 'T', 'X', 't')) {
                // keyword\0 + comp_flag + comp_method + lang\0 + trans\0 + text
                block.kind = png_text_kind(bytes, data_off, keyword_len);
                if (keyword_end + 3 <= end) {
                    const uint8_t comp_flag = u8(bytes[keyword_end + 1]);
                    uint64_t lang           = keyword_end + 3;
                    while (lang < end && u8(bytes[lang]) != 0) {
                        lang += 1;
                    }
                    uint64_t trans = (lang < end) ? lang + 1 : end;
                    while (trans < end && u8(bytes[trans]) != 0) {
                        trans += 1;
                    }
                    const uint64_t text_off = (trans < end) ? trans + 1 : end;
                    block.data_offset       = text_off;
                    block.data_size         = end - text_off;
                    if (comp_flag != 0) {
                        block.compression = BlockCompression::Deflate;
                    }
                }
            }
            sink_emit(&sink, block);
        }

        offset += chunk_size;
        if (type == fourcc('I', 'E', 'N', 'D')) {
            break;
        }
    }

    return sink.result;
}


ScanResult
scan_webp(std::span<const std::byte> bytes,
          std::span<ContainerBlockRef> out) noexcept
{
    BlockSink sink;
    sink.out = out.data();
    sink.cap = static_cast<uint32_t>(out.size());

    if (bytes.size() < 12) {
        sink.result.status = ScanStatus::Malformed;
        return sink.result;
    }
    if (!match(bytes, 0, "RIFF", 4) || !match(bytes, 8, "WEBP", 4)) {
        sink.result.status = ScanStatus::Unsupported;
        return sink.result;
    }

    uint32_t riff_size = 0;
    if (!read_u32le(bytes, 4, &riff_size)) {
        sink.result.status = ScanStatus::Malformed;
        return sink.result;
    }
    const uint64_t file_end = (riff_size + 8ULL < bytes.size())
                                  ? (riff_size + 8ULL)
                                  : static_cast<uint64_t>(bytes.size());

    uint64_t offset = 12;
    while (offset + 8 <= file_end) {
        const uint64_t chunk_off = offset;
        uint32_t type            = 0;
        uint32_t size_le         = 0;
        if (!read_u32be(bytes, offset, &type)
            || !read_u32le(bytes, offset + 4, &size_le)) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }

        const uint64_t data_off  = offset + 8;
        const uint64_t data_size = size_le;
        uint64_t next            = data_off + data_size;
        if (next > file_end) {
            sink.result.status = ScanStatus::Malformed;
            return sink.result;
        }
        if ((data_size & 1U) != 0U && next < file_end) {
            next += 1;
        }

        if (!webp_is_image_chunk(type)) {
            ContainerBlockRef block;
            block.format       = ContainerFormat::Webp;
            block.kind         = ContainerBlockKind::Vendor;
            block.outer_offset = chunk_off;
            block.outer_size   = next - chunk_off;
            block.data_offset  = data_off;
            block.data_size    = data_size;
            block.id           = type;
            if (type == fourcc('E', 'X', 'I', 'F')) {
                block.kind = ContainerBlockKind::Exif;
                skip_exif_preamble(&block, bytes);
            } else if (type == fourcc('X', 'M', 'P', ' ')) {
                block.kind = ContainerBlockKind::Xmp;
            } else if (type == fourcc('I', 'C', 'C', 'P')) {
                block.kind = ContainerBlockKind::Icc;
            }
            sink_emit(&sink, block);
        }

        offset = next;
    }

    return sink.result;
}


ScanResult
scan_tiff(std::span<const std::byte> bytes,
          std::span<ContainerBlockRef> out) noexcept
{
    BlockSink sink;
    sink.out = out.data();
    sink.cap = static_cast<uint32_t>(out.size());

    if (bytes.size() < 8) {
        sink.result.status = ScanStatus::Malformed;
        return sink.result;
    }
    if (!tiff_header_at(bytes, 0)) {
        sink.result.status = ScanStatus::Unsupported;
        return sink.result;
    }

    ContainerBlockRef block;
    block.format       = ContainerFormat::Tiff;
    block.kind         = ContainerBlockKind::Exif;
    block.outer_offset = 0;
    block.outer_size   = static_cast<uint64_t>(bytes.size());
    block.data_offset  = 0;
    block.data_size    = static_cast<uint64_t>(bytes.size());
    sink_emit(&sink, block);
    return sink.result;
}


ScanResult
scan_auto(std::span<const std::byte> bytes,
          std::span<ContainerBlockRef> out) noexcept
{
    switch (detect_format(bytes)) {
    case ContainerFormat::Jpeg: return scan_jpeg(bytes, out);
    case ContainerFormat::Png: return scan_png(bytes, out);
    case ContainerFormat::Webp: return scan_webp(bytes, out);
    case ContainerFormat::Tiff: return scan_tiff(bytes, out);
    case ContainerFormat::Gif:
    case ContainerFormat::Heif:
    case ContainerFormat::Avif:
    case ContainerFormat::Unknown: break;
    }
    ScanResult res;
    res.status = ScanStatus::Unsupported;
    return res;
}


bool
read_pixel_header(std::span<const std::byte> bytes, ContainerFormat format,
                  PixelHeader* out) noexcept
{
    if (!out) {
        return false;
    }
    switch (format) {
    case ContainerFormat::Jpeg: return read_jpeg_pixel_header(bytes, out);
    case ContainerFormat::Png: return read_png_pixel_header(bytes, out);
    case ContainerFormat::Webp: return read_webp_pixel_header(bytes, out);
    case ContainerFormat::Gif:
    case ContainerFormat::Tiff:
    case ContainerFormat::Heif:
    case ContainerFormat::Avif:
    case ContainerFormat::Unknown: break;
    }
    return false;
}

}  // namespace safemeta
