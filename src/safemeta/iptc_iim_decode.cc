#include "safemeta/iptc_iim_decode.h"

#include "byte_io_internal.h"

#include <string>
#include <utility>

namespace safemeta {
namespace {

    using byte_io::read_u16be;
    using byte_io::u8;

    static bool read_iptc_length(std::span<const std::byte> bytes, uint64_t off,
                                 uint64_t* value_len, uint64_t* header_len) noexcept
    {
        // Base length field is 2 bytes. If MSB is set, the low 15 bits specify
        // the number of subsequent bytes used to encode the real length.
        uint16_t len16 = 0;
        if (!read_u16be(bytes, off, &len16)) {
            return false;
        }
        if ((len16 & 0x8000U) == 0) {
            *value_len  = static_cast<uint64_t>(len16);
            *header_len = 2;
            return true;
        }
        const uint16_t nbytes = static_cast<uint16_t>(len16 & 0x7FFFU);
        if (nbytes == 0U || nbytes > 4U) {
            return false;
        }
        if (off + 2 + nbytes > bytes.size()) {
            return false;
        }
        uint32_t v = 0;
        for (uint16_t i = 0; i < nbytes; ++i) {
            v = (v << 8) | static_cast<uint32_t>(u8(bytes[off + 2 + i]));
        }
        *value_len  = static_cast<uint64_t>(v);
        *header_len = static_cast<uint64_t>(2 + nbytes);
        return true;
    }


    static std::string dataset_text(std::span<const std::byte> payload)
    {
        size_t len = payload.size();
        while (len > 0 && (u8(payload[len - 1]) == 0 || u8(payload[len - 1]) == ' ')) {
            len -= 1;
        }
        return std::string(reinterpret_cast<const char*>(payload.data()), len);
    }


    static void set_first(std::optional<std::string>* field,
                          std::span<const std::byte> payload)
    {
        if (!*field) {
            *field = dataset_text(payload);
        }
    }


    static void apply_dataset(uint8_t dataset,
                              std::span<const std::byte> payload,
                              CaptionBlock* caption)
    {
        switch (dataset) {
        case 5: set_first(&caption->object_name, payload); break;
        case 25: caption->keywords.push_back(dataset_text(payload)); break;
        case 80: set_first(&caption->by_line, payload); break;
        case 90: set_first(&caption->city, payload); break;
        case 101: set_first(&caption->country, payload); break;
        case 105: set_first(&caption->headline, payload); break;
        case 116: set_first(&caption->copyright, payload); break;
        case 120: set_first(&caption->caption, payload); break;
        default: break;
        }
    }

}  // namespace

IptcIimDecodeResult
decode_iptc_iim(std::span<const std::byte> iptc_bytes, CaptionBlock& caption,
                const IptcIimDecodeOptions& options) noexcept
{
    IptcIimDecodeResult result;

    if (iptc_bytes.empty() || u8(iptc_bytes[0]) != 0x1C) {
        result.status = IptcIimDecodeStatus::Unsupported;
        return result;
    }

    const uint64_t max_total = options.limits.max_total_bytes;
    if (max_total != 0U && iptc_bytes.size() > max_total) {
        result.status = IptcIimDecodeStatus::LimitExceeded;
        return result;
    }

    CaptionBlock decoded;
    uint64_t total_value_bytes = 0;
    uint64_t p                 = 0;
    while (p < iptc_bytes.size()) {
        // Writers commonly pad the IRB resource with zeros.
        if (u8(iptc_bytes[p]) == 0x00) {
            bool only_zeros = true;
            for (uint64_t i = p; i < iptc_bytes.size(); ++i) {
                if (u8(iptc_bytes[i]) != 0U) {
                    only_zeros = false;
                    break;
                }
            }
            if (only_zeros) {
                break;
            }
        }
        if (result.datasets_decoded >= options.limits.max_datasets) {
            result.status = IptcIimDecodeStatus::LimitExceeded;
            return result;
        }

        // Marker + record + dataset + len(2+) => min 5 bytes.
        if (p + 5 > iptc_bytes.size() || u8(iptc_bytes[p]) != 0x1C) {
            result.status = IptcIimDecodeStatus::Malformed;
            return result;
        }
        const uint8_t record  = u8(iptc_bytes[p + 1]);
        const uint8_t dataset = u8(iptc_bytes[p + 2]);

        uint64_t value_len  = 0;
        uint64_t header_len = 0;
        if (!read_iptc_length(iptc_bytes, p + 3, &value_len, &header_len)) {
            result.status = IptcIimDecodeStatus::Malformed;
            return result;
        }
        if (value_len > options.limits.max_dataset_bytes) {
            result.status = IptcIimDecodeStatus::LimitExceeded;
            return result;
        }

        const uint64_t value_off = p + 3 + header_len;
        if (value_off + value_len > iptc_bytes.size()) {
            result.status = IptcIimDecodeStatus::Malformed;
            return result;
        }

        total_value_bytes += value_len;
        if (max_total != 0U && total_value_bytes > max_total) {
            result.status = IptcIimDecodeStatus::LimitExceeded;
            return result;
        }

        if (record == 2 && dataset != 0) {
            const std::span<const std::byte> payload
                = iptc_bytes.subspan(static_cast<size_t>(value_off),
                                     static_cast<size_t>(value_len));
            apply_dataset(dataset, payload, &decoded);
            decoded.dataset_count += 1;
        }
        result.datasets_decoded += 1;

        p = value_off + value_len;
    }

    caption = std::move(decoded);
    return result;
}


const char*
iptc_iim_decode_status_name(IptcIimDecodeStatus status) noexcept
{
    switch (status) {
    case IptcIimDecodeStatus::Ok: return "ok";
    case IptcIimDecodeStatus::Unsupported: return "unsupported";
    case IptcIimDecodeStatus::Malformed: return "malformed";
    case IptcIimDecodeStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace safemeta
