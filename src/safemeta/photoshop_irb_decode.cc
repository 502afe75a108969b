#include "safemeta/photoshop_irb_decode.h"

#include "byte_io_internal.h"

namespace safemeta {
namespace {

    using byte_io::match;
    using byte_io::read_u16be;
    using byte_io::read_u32be;
    using byte_io::u8;

    static uint64_t pad2(uint64_t n) noexcept { return (n + 1U) & ~1ULL; }


    static bool only_zeros_from(std::span<const std::byte> bytes,
                                uint64_t p) noexcept
    {
        for (uint64_t i = p; i < bytes.size(); ++i) {
            if (u8(bytes[i]) != 0U) {
                return false;
            }
        }
        return true;
    }

}  // namespace

PhotoshopIrbDecodeResult
decode_photoshop_irb(std::span<const std::byte> irb_bytes, CaptionBlock& caption,
                     const PhotoshopIrbDecodeOptions& options) noexcept
{
    PhotoshopIrbDecodeResult result;

    if (irb_bytes.empty() || !match(irb_bytes, 0, "8BIM", 4)) {
        result.status = PhotoshopIrbDecodeStatus::Unsupported;
        return result;
    }

    const uint64_t max_total = options.limits.max_total_bytes;
    if (max_total != 0U && irb_bytes.size() > max_total) {
        result.status = PhotoshopIrbDecodeStatus::LimitExceeded;
        return result;
    }

    uint64_t total_value_bytes = 0;
    uint64_t p                 = 0;
    while (p < irb_bytes.size()) {
        if (result.resources_decoded >= options.limits.max_resources) {
            result.status = PhotoshopIrbDecodeStatus::LimitExceeded;
            return result;
        }
        if (p + 4 > irb_bytes.size()) {
            break;
        }
        if (!match(irb_bytes, p, "8BIM", 4)) {
            // Some writers pad with zeros; treat trailing zeros as EOF.
            if (only_zeros_from(irb_bytes, p)) {
                break;
            }
            result.status = PhotoshopIrbDecodeStatus::Malformed;
            return result;
        }
        p += 4;

        uint16_t resource_id = 0;
        if (!read_u16be(irb_bytes, p, &resource_id)) {
            result.status = PhotoshopIrbDecodeStatus::Malformed;
            return result;
        }
        p += 2;

        if (p >= irb_bytes.size()) {
            result.status = PhotoshopIrbDecodeStatus::Malformed;
            return result;
        }
        const uint8_t name_len    = u8(irb_bytes[p]);
        const uint64_t name_total = pad2(static_cast<uint64_t>(1 + name_len));
        if (p + name_total > irb_bytes.size()) {
            result.status = PhotoshopIrbDecodeStatus::Malformed;
            return result;
        }
        p += name_total;

        uint32_t data_len32 = 0;
        if (!read_u32be(irb_bytes, p, &data_len32)) {
            result.status = PhotoshopIrbDecodeStatus::Malformed;
            return result;
        }
        p += 4;

        const uint64_t data_len = static_cast<uint64_t>(data_len32);
        if (data_len > options.limits.max_resource_len) {
            result.status = PhotoshopIrbDecodeStatus::LimitExceeded;
            return result;
        }

        const uint64_t data_off = p;
        if (data_off + data_len > irb_bytes.size()) {
            result.status = PhotoshopIrbDecodeStatus::Malformed;
            return result;
        }

        total_value_bytes += data_len;
        if (max_total != 0U && total_value_bytes > max_total) {
            result.status = PhotoshopIrbDecodeStatus::LimitExceeded;
            return result;
        }

        const std::span<const std::byte> payload
            = irb_bytes.subspan(static_cast<size_t>(data_off),
                                static_cast<size_t>(data_len));

        if (resource_id == 0x0404 && !result.iptc_found) {
            result.iptc_found = true;
            result.iptc_status
                = decode_iptc_iim(payload, caption, options.iptc).status;
        } else if (resource_id == 0x0422 && result.exif_size == 0) {
            result.exif_offset = data_off;
            result.exif_size   = data_len;
        } else if (resource_id == 0x0424 && result.xmp_size == 0) {
            result.xmp_offset = data_off;
            result.xmp_size   = data_len;
        }
        result.resources_decoded += 1;

        // The final resource may omit its pad byte.
        p = data_off + pad2(data_len);
    }

    return result;
}

}  // namespace safemeta
