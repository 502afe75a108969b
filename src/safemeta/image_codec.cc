#include "safemeta/image_codec.h"

#include "byte_io_internal.h"

#include <zlib.h>

namespace safemeta {
namespace {

    using byte_io::append_ascii;
    using byte_io::append_bytes;
    using byte_io::append_u16be;
    using byte_io::append_u24le;
    using byte_io::append_u32be;
    using byte_io::append_u32le;
    using byte_io::match;
    using byte_io::read_u16be;
    using byte_io::read_u32be;
    using byte_io::read_u32le;
    using byte_io::store_u32le;
    using byte_io::u8;

    // JPEG APP1 payload limit: 65535 minus the 2-byte length field.
    constexpr uint64_t kJpegMaxSegmentData = 65533;
    constexpr uint32_t kWebpMaxCanvas      = 1U << 24;

    constexpr uint32_t kPngIhdr = fourcc('I', 'H', 'D', 'R');
    constexpr uint32_t kPngPlte = fourcc('P', 'L', 'T', 'E');
    constexpr uint32_t kPngTrns = fourcc('t', 'R', 'N', 'S');
    constexpr uint32_t kPngIdat = fourcc('I', 'D', 'A', 'T');
    constexpr uint32_t kPngIend = fourcc('I', 'E', 'N', 'D');

    constexpr uint32_t kWebpVp8x = fourcc('V', 'P', '8', 'X');
    constexpr uint32_t kWebpVp8  = fourcc('V', 'P', '8', ' ');
    constexpr uint32_t kWebpVp8l = fourcc('V', 'P', '8', 'L');
    constexpr uint32_t kWebpAlph = fourcc('A', 'L', 'P', 'H');
    constexpr uint32_t kWebpAnim = fourcc('A', 'N', 'I', 'M');
    constexpr uint32_t kWebpAnmf = fourcc('A', 'N', 'M', 'F');

    static void add_part(std::vector<PayloadPart>* parts, uint64_t offset,
                         uint64_t size, uint32_t id)
    {
        PayloadPart p;
        p.offset = offset;
        p.size   = size;
        p.id     = id;
        parts->push_back(p);
    }


    static bool is_jpeg_sof(uint8_t marker) noexcept
    {
        // C4 (DHT), C8 (JPG) and CC (DAC) share the range.
        return marker >= 0xC0 && marker <= 0xCF && marker != 0xC4
               && marker != 0xC8 && marker != 0xCC;
    }


    static bool is_jpeg_standalone(uint8_t marker) noexcept
    {
        return marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7);
    }


    /// Returns the offset of the first marker after entropy-coded data, or
    /// bytes.size() when none is found.
    static uint64_t skip_entropy(std::span<const std::byte> bytes,
                                 uint64_t p) noexcept
    {
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
                // Fill byte.
                p += 1;
                continue;
            }
            return p;
        }
        return bytes.size();
    }


    static CodecStatus decode_jpeg(std::span<const std::byte> bytes,
                                   DecodedImage* out)
    {
        if (bytes.size() < 4 || u8(bytes[0]) != 0xFF || u8(bytes[1]) != 0xD8) {
            return CodecStatus::UndecodablePayload;
        }

        bool has_sof = false;
        bool has_sos = false;
        bool has_eoi = false;
        uint64_t p   = 2;
        while (p < bytes.size()) {
            if (u8(bytes[p]) != 0xFF) {
                return CodecStatus::UndecodablePayload;
            }
            const uint64_t marker_off = p;
            while (p < bytes.size() && u8(bytes[p]) == 0xFF) {
                p += 1;
            }
            if (p >= bytes.size()) {
                return CodecStatus::UndecodablePayload;
            }
            const uint8_t marker = u8(bytes[p]);
            p += 1;

            if (marker == 0xD9) {
                if (!has_sos) {
                    return CodecStatus::UndecodablePayload;
                }
                add_part(&out->pixel_parts, marker_off, p - marker_off,
                         0xFF00U | marker);
                has_eoi = true;
                break;
            }
            if (is_jpeg_standalone(marker)) {
                add_part(&out->pixel_parts, marker_off, p - marker_off,
                         0xFF00U | marker);
                continue;
            }
            if (marker == 0xD8 || marker == 0x00) {
                return CodecStatus::UndecodablePayload;
            }

            uint16_t seg_len = 0;
            if (!read_u16be(bytes, p, &seg_len) || seg_len < 2
                || p + seg_len > bytes.size()) {
                return CodecStatus::UndecodablePayload;
            }
            const uint64_t seg_end  = p + seg_len;
            const uint64_t data_off = p + 2;
            const uint32_t id       = 0xFF00U | marker;

            if (marker >= 0xE0 && marker <= 0xEF) {
                const bool adobe = marker == 0xEE
                                   && match(bytes, data_off, "Adobe", 5);
                if (adobe) {
                    add_part(&out->pixel_parts, marker_off,
                             seg_end - marker_off, id);
                } else {
                    add_part(&out->metadata_parts, marker_off,
                             seg_end - marker_off, id);
                }
                p = seg_end;
                continue;
            }
            if (marker == 0xFE) {
                add_part(&out->metadata_parts, marker_off, seg_end - marker_off,
                         id);
                p = seg_end;
                continue;
            }

            if (is_jpeg_sof(marker)) {
                uint16_t h = 0;
                uint16_t w = 0;
                if (!read_u16be(bytes, data_off + 1, &h)
                    || !read_u16be(bytes, data_off + 3, &w)
                    || data_off + 6 > seg_end) {
                    return CodecStatus::UndecodablePayload;
                }
                if (!has_sof) {
                    out->canvas_width  = w;
                    out->canvas_height = h;
                }
                has_sof = true;
            }
            add_part(&out->pixel_parts, marker_off, seg_end - marker_off, id);
            p = seg_end;

            if (marker == 0xDA) {
                if (!has_sof) {
                    return CodecStatus::UndecodablePayload;
                }
                has_sos = true;
                const uint64_t next = skip_entropy(bytes, p);
                if (next >= bytes.size()) {
                    return CodecStatus::UndecodablePayload;
                }
                if (next > p) {
                    add_part(&out->pixel_parts, p, next - p, 0);
                }
                p = next;
            }
        }

        if (!has_sof || !has_sos || !has_eoi) {
            return CodecStatus::UndecodablePayload;
        }
        if (p < bytes.size()) {
            // Trailing data (MPF secondary images, vendor trailers).
            add_part(&out->metadata_parts, p, bytes.size() - p, 0);
        }
        return CodecStatus::Ok;
    }


    static CodecStatus decode_png(std::span<const std::byte> bytes,
                                  DecodedImage* out)
    {
        static constexpr uint8_t kSig[8] = { 0x89, 'P',  'N',  'G',
                                             0x0D, 0x0A, 0x1A, 0x0A };
        if (bytes.size() < 8) {
            return CodecStatus::UndecodablePayload;
        }
        for (uint32_t i = 0; i < 8; ++i) {
            if (u8(bytes[i]) != kSig[i]) {
                return CodecStatus::UndecodablePayload;
            }
        }

        bool has_ihdr = false;
        bool has_idat = false;
        bool has_iend = false;
        uint64_t p    = 8;
        while (p < bytes.size()) {
            uint32_t len  = 0;
            uint32_t type = 0;
            if (!read_u32be(bytes, p, &len) || !read_u32be(bytes, p + 4, &type)
                || len > 0x7FFFFFFFU) {
                return CodecStatus::UndecodablePayload;
            }
            const uint64_t chunk_size = 12ULL + len;
            if (chunk_size > bytes.size() - p) {
                return CodecStatus::UndecodablePayload;
            }
            if (!has_ihdr && type != kPngIhdr) {
                return CodecStatus::UndecodablePayload;
            }

            if (type == kPngIhdr) {
                uint32_t w = 0;
                uint32_t h = 0;
                if (has_ihdr || len < 13 || !read_u32be(bytes, p + 8, &w)
                    || !read_u32be(bytes, p + 12, &h)) {
                    return CodecStatus::UndecodablePayload;
                }
                const uint8_t color_type = u8(bytes[p + 17]);
                out->canvas_width        = w;
                out->canvas_height       = h;
                out->has_alpha = color_type == 4 || color_type == 6;
                has_ihdr       = true;
            }

            const bool keep = type == kPngIhdr || type == kPngPlte
                              || type == kPngTrns || type == kPngIdat
                              || type == kPngIend;
            if (keep) {
                add_part(&out->pixel_parts, p, chunk_size, type);
            } else {
                add_part(&out->metadata_parts, p, chunk_size, type);
            }
            if (type == kPngIdat) {
                has_idat = true;
            }
            p += chunk_size;
            if (type == kPngIend) {
                has_iend = true;
                break;
            }
        }

        if (!has_ihdr || !has_idat || !has_iend) {
            return CodecStatus::UndecodablePayload;
        }
        if (p < bytes.size()) {
            add_part(&out->metadata_parts, p, bytes.size() - p, 0);
        }
        return CodecStatus::Ok;
    }


    static CodecStatus decode_webp(std::span<const std::byte> bytes,
                                   DecodedImage* out)
    {
        uint32_t riff_size = 0;
        if (bytes.size() < 12 || !match(bytes, 0, "RIFF", 4)
            || !match(bytes, 8, "WEBP", 4) || !read_u32le(bytes, 4, &riff_size)
            || riff_size < 4 || 8ULL + riff_size > bytes.size()) {
            return CodecStatus::UndecodablePayload;
        }
        const uint64_t end = 8ULL + riff_size;

        bool has_bitstream = false;
        bool has_alph      = false;
        bool vp8x_alpha    = false;
        uint64_t p         = 12;
        while (p < end) {
            uint32_t type = 0;
            uint32_t len  = 0;
            if (!read_u32be(bytes, p, &type) || !read_u32le(bytes, p + 4, &len)) {
                return CodecStatus::UndecodablePayload;
            }
            const uint64_t padded = (static_cast<uint64_t>(len) + 1U) & ~1ULL;
            if (8ULL + static_cast<uint64_t>(len) > end - p) {
                return CodecStatus::UndecodablePayload;
            }
            // The final chunk may omit its pad byte.
            const uint64_t chunk_size = (8ULL + padded <= end - p)
                                            ? 8ULL + padded
                                            : 8ULL + len;

            if (type == kWebpAnim || type == kWebpAnmf) {
                return CodecStatus::UnsupportedFormat;
            }
            if (type == kWebpVp8x) {
                if (len < 10) {
                    return CodecStatus::UndecodablePayload;
                }
                const uint8_t flags = u8(bytes[p + 8]);
                if ((flags & 0x02U) != 0U) {
                    return CodecStatus::UnsupportedFormat;
                }
                vp8x_alpha = (flags & 0x10U) != 0U;
                add_part(&out->metadata_parts, p, chunk_size, type);
            } else if (type == kWebpVp8 || type == kWebpVp8l
                       || type == kWebpAlph) {
                if (type == kWebpAlph) {
                    has_alph = true;
                } else {
                    if (has_bitstream) {
                        return CodecStatus::UndecodablePayload;
                    }
                    has_bitstream = true;
                }
                add_part(&out->pixel_parts, p, chunk_size, type);
            } else {
                add_part(&out->metadata_parts, p, chunk_size, type);
            }
            p += chunk_size;
        }

        if (!has_bitstream) {
            return CodecStatus::UndecodablePayload;
        }
        PixelHeader header;
        if (!read_pixel_header(bytes, ContainerFormat::Webp, &header)
            || header.width == 0U || header.height == 0U) {
            return CodecStatus::UndecodablePayload;
        }
        out->canvas_width  = header.width;
        out->canvas_height = header.height;
        out->has_alpha     = vp8x_alpha || has_alph || header.has_alpha;
        if (end < bytes.size()) {
            add_part(&out->metadata_parts, end, bytes.size() - end, 0);
        }
        return CodecStatus::Ok;
    }


    static void append_parts(const DecodedImage& image, size_t first,
                             size_t last, std::vector<std::byte>* out)
    {
        for (size_t i = first; i < last; ++i) {
            const PayloadPart& part = image.pixel_parts[i];
            append_bytes(out, image.source.subspan(
                                  static_cast<size_t>(part.offset),
                                  static_cast<size_t>(part.size)));
        }
    }


    static CodecStatus encode_jpeg(const DecodedImage& image,
                                   std::span<const std::byte> exif_tiff,
                                   std::vector<std::byte>* out)
    {
        if (!exif_tiff.empty() && 6U + exif_tiff.size() > kJpegMaxSegmentData) {
            return CodecStatus::EncodeFailure;
        }
        out->push_back(std::byte { 0xFF });
        out->push_back(std::byte { 0xD8 });
        if (!exif_tiff.empty()) {
            out->push_back(std::byte { 0xFF });
            out->push_back(std::byte { 0xE1 });
            append_u16be(out, static_cast<uint16_t>(2U + 6U + exif_tiff.size()));
            append_ascii(out, "Exif\0\0", 6);
            append_bytes(out, exif_tiff);
        }
        append_parts(image, 0, image.pixel_parts.size(), out);
        return CodecStatus::Ok;
    }


    static void append_png_chunk(std::vector<std::byte>* out, uint32_t type,
                                 std::span<const std::byte> data)
    {
        append_u32be(out, static_cast<uint32_t>(data.size()));
        const size_t type_at = out->size();
        append_u32be(out, type);
        append_bytes(out, data);

        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(out->data() + type_at),
                    static_cast<uInt>(4U + data.size()));
        append_u32be(out, static_cast<uint32_t>(crc));
    }


    static CodecStatus encode_png(const DecodedImage& image,
                                  std::span<const std::byte> exif_tiff,
                                  std::vector<std::byte>* out)
    {
        if (exif_tiff.size() > 0x7FFFFFFFU) {
            return CodecStatus::EncodeFailure;
        }
        static constexpr uint8_t kSig[8] = { 0x89, 'P',  'N',  'G',
                                             0x0D, 0x0A, 0x1A, 0x0A };
        for (uint8_t b : kSig) {
            out->push_back(std::byte { b });
        }

        size_t first_idat = image.pixel_parts.size();
        for (size_t i = 0; i < image.pixel_parts.size(); ++i) {
            if (image.pixel_parts[i].id == kPngIdat) {
                first_idat = i;
                break;
            }
        }
        append_parts(image, 0, first_idat, out);
        if (!exif_tiff.empty()) {
            append_png_chunk(out, fourcc('e', 'X', 'I', 'f'), exif_tiff);
        }
        append_parts(image, first_idat, image.pixel_parts.size(), out);
        return CodecStatus::Ok;
    }


    static CodecStatus encode_webp(const DecodedImage& image,
                                   std::span<const std::byte> exif_tiff,
                                   std::vector<std::byte>* out)
    {
        if (image.canvas_width == 0U || image.canvas_height == 0U
            || image.canvas_width > kWebpMaxCanvas
            || image.canvas_height > kWebpMaxCanvas
            || exif_tiff.size() > 0x7FFFFFF0U) {
            return CodecStatus::EncodeFailure;
        }

        append_ascii(out, "RIFF", 4);
        append_u32le(out, 0);
        append_ascii(out, "WEBP", 4);

        uint8_t flags = 0;
        if (!exif_tiff.empty()) {
            flags |= 0x08U;
        }
        if (image.has_alpha) {
            flags |= 0x10U;
        }
        append_ascii(out, "VP8X", 4);
        append_u32le(out, 10);
        out->push_back(std::byte { flags });
        out->push_back(std::byte { 0 });
        out->push_back(std::byte { 0 });
        out->push_back(std::byte { 0 });
        append_u24le(out, image.canvas_width - 1U);
        append_u24le(out, image.canvas_height - 1U);

        append_parts(image, 0, image.pixel_parts.size(), out);
        if ((out->size() & 1U) != 0U) {
            // A source whose last chunk omitted its pad byte.
            out->push_back(std::byte { 0 });
        }

        if (!exif_tiff.empty()) {
            append_ascii(out, "EXIF", 4);
            append_u32le(out, static_cast<uint32_t>(exif_tiff.size()));
            append_bytes(out, exif_tiff);
            if ((exif_tiff.size() & 1U) != 0U) {
                out->push_back(std::byte { 0 });
            }
        }

        if (out->size() - 8U > 0xFFFFFFFFULL) {
            return CodecStatus::EncodeFailure;
        }
        store_u32le(out, 4, static_cast<uint32_t>(out->size() - 8U));
        return CodecStatus::Ok;
    }


    static bool parts_in_range(const DecodedImage& image) noexcept
    {
        const uint64_t n = image.source.size();
        for (const PayloadPart& part : image.pixel_parts) {
            if (part.offset > n || part.size > n - part.offset) {
                return false;
            }
        }
        return true;
    }

}  // namespace

CodecStatus
ContainerCodec::decode(std::span<const std::byte> bytes,
                       DecodedImage* out) const noexcept
{
    if (!out) {
        return CodecStatus::UndecodablePayload;
    }
    *out        = DecodedImage {};
    out->format = detect_format(bytes);
    out->source = bytes;

    switch (out->format) {
    case ContainerFormat::Jpeg: return decode_jpeg(bytes, out);
    case ContainerFormat::Png: return decode_png(bytes, out);
    case ContainerFormat::Webp: return decode_webp(bytes, out);
    case ContainerFormat::Gif:
    case ContainerFormat::Tiff:
    case ContainerFormat::Heif:
    case ContainerFormat::Avif: return CodecStatus::UnsupportedFormat;
    case ContainerFormat::Unknown: break;
    }
    return CodecStatus::UnrecognizedFormat;
}


CodecStatus
ContainerCodec::encode(const DecodedImage& image,
                       std::span<const std::byte> exif_tiff,
                       std::vector<std::byte>* out) const noexcept
{
    if (!out) {
        return CodecStatus::EncodeFailure;
    }
    out->clear();
    if (image.pixel_parts.empty() || !parts_in_range(image)) {
        return CodecStatus::UndecodablePayload;
    }

    CodecStatus status = CodecStatus::UnrecognizedFormat;
    switch (image.format) {
    case ContainerFormat::Jpeg:
        status = encode_jpeg(image, exif_tiff, out);
        break;
    case ContainerFormat::Png: status = encode_png(image, exif_tiff, out); break;
    case ContainerFormat::Webp:
        status = encode_webp(image, exif_tiff, out);
        break;
    case ContainerFormat::Gif:
    case ContainerFormat::Tiff:
    case ContainerFormat::Heif:
    case ContainerFormat::Avif: status = CodecStatus::UnsupportedFormat; break;
    case ContainerFormat::Unknown: break;
    }
    if (status != CodecStatus::Ok) {
        out->clear();
    }
    return status;
}


const ImageCodec&
default_image_codec() noexcept
{
    static const ContainerCodec codec {};
    return codec;
}


std::vector<std::byte>
pixel_payload_bytes(const DecodedImage& image)
{
    std::vector<std::byte> out;
    if (!parts_in_range(image)) {
        return out;
    }
    append_parts(image, 0, image.pixel_parts.size(), &out);
    return out;
}


const char*
codec_status_name(CodecStatus status) noexcept
{
    switch (status) {
    case CodecStatus::Ok: return "ok";
    case CodecStatus::UnrecognizedFormat: return "unrecognized_format";
    case CodecStatus::UnsupportedFormat: return "unsupported_format";
    case CodecStatus::UndecodablePayload: return "undecodable_payload";
    case CodecStatus::EncodeFailure: return "encode_failure";
    }
    return "unknown";
}

}  // namespace safemeta
