#include "safemeta/exif_tiff_decode.h"

#include "byte_io_internal.h"

#include <array>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace safemeta {
namespace {

    using byte_io::read_u16be;
    using byte_io::read_u16le;
    using byte_io::read_u32be;
    using byte_io::read_u32le;
    using byte_io::read_u64be;
    using byte_io::read_u64le;
    using byte_io::u8;

    struct TiffConfig final {
        bool le      = true;
        bool bigtiff = false;
    };

    struct IfdEntry final {
        uint16_t tag         = 0;
        uint16_t type        = 0;
        uint64_t count       = 0;
        uint64_t value_off   = 0;
        uint64_t value_bytes = 0;
    };

    static bool read_tiff_u16(const TiffConfig& cfg,
                              std::span<const std::byte> bytes, uint64_t offset,
                              uint16_t* out) noexcept
    {
        if (cfg.le) {
            return read_u16le(bytes, offset, out);
        }
        return read_u16be(bytes, offset, out);
    }

    static bool read_tiff_u32(const TiffConfig& cfg,
                              std::span<const std::byte> bytes, uint64_t offset,
                              uint32_t* out) noexcept
    {
        if (cfg.le) {
            return read_u32le(bytes, offset, out);
        }
        return read_u32be(bytes, offset, out);
    }

    static bool read_tiff_u64(const TiffConfig& cfg,
                              std::span<const std::byte> bytes, uint64_t offset,
                              uint64_t* out) noexcept
    {
        if (cfg.le) {
            return read_u64le(bytes, offset, out);
        }
        return read_u64be(bytes, offset, out);
    }

    static uint64_t tiff_type_size(uint16_t type) noexcept
    {
        switch (type) {
        case 1:    // BYTE
        case 2:    // ASCII
        case 6:    // SBYTE
        case 7:    // UNDEFINED
        case 129:  // UTF-8 (EXIF 3.0)
            return 1;
        case 3:  // SHORT
        case 8:  // SSHORT
            return 2;
        case 4:   // LONG
        case 9:   // SLONG
        case 11:  // FLOAT
        case 13:  // IFD
            return 4;
        case 5:   // RATIONAL
        case 10:  // SRATIONAL
        case 12:  // DOUBLE
        case 16:  // LONG8
        case 17:  // SLONG8
        case 18:  // IFD8
            return 8;
        default: return 0;
        }
    }


    static void update_status(ExifDecodeStatus* out,
                              ExifDecodeStatus status) noexcept
    {
        if (*out == ExifDecodeStatus::LimitExceeded) {
            return;
        }
        if (status == ExifDecodeStatus::LimitExceeded) {
            *out = status;
            return;
        }
        if (*out == ExifDecodeStatus::Malformed) {
            return;
        }
        if (status == ExifDecodeStatus::Malformed
            || status == ExifDecodeStatus::Unsupported) {
            *out = status;
        }
    }


    // Reads one IFD entry table. Returns false when the table itself is
    // unreadable; entries with out-of-range values are skipped and reported
    // through `status`.
    static bool read_ifd(const TiffConfig& cfg, std::span<const std::byte> bytes,
                         uint64_t offset, const ExifDecodeLimits& limits,
                         uint32_t* total_entries, std::vector<IfdEntry>* out,
                         ExifDecodeStatus* status) noexcept
    {
        out->clear();
        if (offset == 0 || offset >= bytes.size()) {
            update_status(status, ExifDecodeStatus::Malformed);
            return false;
        }

        uint64_t entry_count = 0;
        uint64_t entries_off = 0;
        uint64_t entry_size  = 0;
        if (!cfg.bigtiff) {
            uint16_t n16 = 0;
            if (!read_tiff_u16(cfg, bytes, offset, &n16)) {
                update_status(status, ExifDecodeStatus::Malformed);
                return false;
            }
            entry_count = n16;
            entries_off = offset + 2;
            entry_size  = 12;
        } else {
            if (!read_tiff_u64(cfg, bytes, offset, &entry_count)) {
                update_status(status, ExifDecodeStatus::Malformed);
                return false;
            }
            entries_off = offset + 8;
            entry_size  = 20;
        }

        if (entry_count > limits.max_entries_per_ifd) {
            update_status(status, ExifDecodeStatus::LimitExceeded);
            return false;
        }
        if (entries_off + entry_count * entry_size > bytes.size()) {
            update_status(status, ExifDecodeStatus::Malformed);
            return false;
        }
        if (*total_entries + entry_count > limits.max_total_entries) {
            update_status(status, ExifDecodeStatus::LimitExceeded);
            return false;
        }
        *total_entries += static_cast<uint32_t>(entry_count);

        out->reserve(static_cast<size_t>(entry_count));
        for (uint64_t i = 0; i < entry_count; ++i) {
            const uint64_t eoff = entries_off + i * entry_size;

            IfdEntry e;
            uint64_t value_or_off    = 0;
            uint64_t value_field_off = 0;
            if (!read_tiff_u16(cfg, bytes, eoff + 0, &e.tag)
                || !read_tiff_u16(cfg, bytes, eoff + 2, &e.type)) {
                update_status(status, ExifDecodeStatus::Malformed);
                continue;
            }
            if (!cfg.bigtiff) {
                uint32_t c32 = 0;
                uint32_t v32 = 0;
                if (!read_tiff_u32(cfg, bytes, eoff + 4, &c32)
                    || !read_tiff_u32(cfg, bytes, eoff + 8, &v32)) {
                    update_status(status, ExifDecodeStatus::Malformed);
                    continue;
                }
                e.count         = c32;
                value_or_off    = v32;
                value_field_off = eoff + 8;
            } else {
                if (!read_tiff_u64(cfg, bytes, eoff + 4, &e.count)
                    || !read_tiff_u64(cfg, bytes, eoff + 12, &value_or_off)) {
                    update_status(status, ExifDecodeStatus::Malformed);
                    continue;
                }
                value_field_off = eoff + 12;
            }

            const uint64_t unit = tiff_type_size(e.type);
            if (unit == 0) {
                // Unknown types still count as tags of their IFD.
                out->push_back(e);
                continue;
            }
            if (e.count > (UINT64_MAX / unit)) {
                update_status(status, ExifDecodeStatus::Malformed);
                continue;
            }
            e.value_bytes             = e.count * unit;
            const uint64_t inline_cap = cfg.bigtiff ? 8U : 4U;
            e.value_off = (e.value_bytes <= inline_cap) ? value_field_off
                                                        : value_or_off;
            if (e.value_off > bytes.size()
                || e.value_bytes > bytes.size() - e.value_off) {
                update_status(status, ExifDecodeStatus::Malformed);
                continue;
            }
            out->push_back(e);
        }
        return true;
    }


    static bool entry_uint(const TiffConfig& cfg,
                           std::span<const std::byte> bytes, const IfdEntry& e,
                           uint64_t index, uint64_t* out) noexcept
    {
        if (index >= e.count || e.value_bytes == 0) {
            return false;
        }
        switch (e.type) {
        case 1:
        case 7: *out = u8(bytes[e.value_off + index]); return true;
        case 3: {
            uint16_t v = 0;
            if (!read_tiff_u16(cfg, bytes, e.value_off + index * 2, &v)) {
                return false;
            }
            *out = v;
            return true;
        }
        case 4:
        case 13: {
            uint32_t v = 0;
            if (!read_tiff_u32(cfg, bytes, e.value_off + index * 4, &v)) {
                return false;
            }
            *out = v;
            return true;
        }
        case 16:
        case 18: return read_tiff_u64(cfg, bytes, e.value_off + index * 8, out);
        default: return false;
        }
    }


    static bool entry_rational(const TiffConfig& cfg,
                               std::span<const std::byte> bytes,
                               const IfdEntry& e, uint64_t index,
                               double* out) noexcept
    {
        if (index >= e.count || (e.type != 5 && e.type != 10)) {
            return false;
        }
        const uint64_t off = e.value_off + index * 8;
        uint32_t num       = 0;
        uint32_t den       = 0;
        if (!read_tiff_u32(cfg, bytes, off + 0, &num)
            || !read_tiff_u32(cfg, bytes, off + 4, &den) || den == 0) {
            return false;
        }
        if (e.type == 5) {
            *out = static_cast<double>(num) / static_cast<double>(den);
        } else {
            *out = static_cast<double>(static_cast<int32_t>(num))
                   / static_cast<double>(static_cast<int32_t>(den));
        }
        return std::isfinite(*out);
    }


    static bool entry_text(std::span<const std::byte> bytes, const IfdEntry& e,
                           const ExifDecodeLimits& limits,
                           ExifDecodeStatus* status, std::string* out)
    {
        if (e.type != 1 && e.type != 2 && e.type != 7 && e.type != 129) {
            return false;
        }
        if (e.value_bytes > limits.max_string_bytes) {
            update_status(status, ExifDecodeStatus::LimitExceeded);
            return false;
        }
        const char* p = reinterpret_cast<const char*>(bytes.data()
                                                      + e.value_off);
        size_t len = 0;
        while (len < e.value_bytes && p[len] != '\0') {
            len += 1;
        }
        while (len > 0 && p[len - 1] == ' ') {
            len -= 1;
        }
        out->assign(p, len);
        return true;
    }


    static std::optional<std::string>
    text_field(std::span<const std::byte> bytes, const IfdEntry& e,
               const ExifDecodeLimits& limits, ExifDecodeStatus* status,
               uint32_t* tag_count)
    {
        std::string s;
        if (!entry_text(bytes, e, limits, status, &s)) {
            return std::nullopt;
        }
        *tag_count += 1;
        return s;
    }


    // Degrees/minutes/seconds triplet to decimal degrees. Missing minute or
    // second components count as zero.
    static bool gps_coordinate(const TiffConfig& cfg,
                               std::span<const std::byte> bytes,
                               const IfdEntry& e, double* out) noexcept
    {
        double deg = 0.0;
        if (!entry_rational(cfg, bytes, e, 0, &deg)) {
            return false;
        }
        double min = 0.0;
        double sec = 0.0;
        (void)entry_rational(cfg, bytes, e, 1, &min);
        (void)entry_rational(cfg, bytes, e, 2, &sec);
        *out = deg + min / 60.0 + sec / 3600.0;
        return true;
    }


    static char ref_char(std::span<const std::byte> bytes,
                         const IfdEntry& e) noexcept
    {
        if ((e.type != 2 && e.type != 7) || e.value_bytes == 0) {
            return '\0';
        }
        return static_cast<char>(u8(bytes[e.value_off]));
    }


    static void decode_gps_ifd(const TiffConfig& cfg,
                               std::span<const std::byte> bytes,
                               std::span<const IfdEntry> entries,
                               const ExifDecodeLimits& limits,
                               ExifDecodeStatus* status, GpsBlock* gps)
    {
        char lat_ref = '\0';
        char lon_ref = '\0';
        bool below_sea_level = false;
        gps->tag_count = static_cast<uint32_t>(entries.size());

        for (const IfdEntry& e : entries) {
            switch (e.tag) {
            case 0x0001: lat_ref = ref_char(bytes, e); break;
            case 0x0003: lon_ref = ref_char(bytes, e); break;
            case 0x0002: {
                double v = 0.0;
                if (gps_coordinate(cfg, bytes, e, &v)) {
                    gps->latitude = v;
                }
                break;
            }
            case 0x0004: {
                double v = 0.0;
                if (gps_coordinate(cfg, bytes, e, &v)) {
                    gps->longitude = v;
                }
                break;
            }
            case 0x0005: {
                uint64_t v = 0;
                below_sea_level = entry_uint(cfg, bytes, e, 0, &v) && v == 1;
                break;
            }
            case 0x0006: {
                double v = 0.0;
                if (entry_rational(cfg, bytes, e, 0, &v)) {
                    gps->altitude = v;
                }
                break;
            }
            case 0x0007: {
                double h = 0.0;
                double m = 0.0;
                double s = 0.0;
                if (entry_rational(cfg, bytes, e, 0, &h)
                    && entry_rational(cfg, bytes, e, 1, &m)
                    && entry_rational(cfg, bytes, e, 2, &s)
                    && h >= 0.0 && h < 24.0 && m >= 0.0 && m < 60.0
                    && s >= 0.0 && s < 61.0) {
                    char buf[32];
                    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d",
                                  static_cast<int>(h), static_cast<int>(m),
                                  static_cast<int>(s));
                    gps->time_stamp = std::string(buf);
                }
                break;
            }
            case 0x001D: {
                std::string s;
                if (entry_text(bytes, e, limits, status, &s)) {
                    gps->date_stamp = std::move(s);
                }
                break;
            }
            default: break;
            }
        }

        if (gps->latitude && (lat_ref == 'S' || lat_ref == 's')) {
            *gps->latitude = -*gps->latitude;
        }
        if (gps->longitude && (lon_ref == 'W' || lon_ref == 'w')) {
            *gps->longitude = -*gps->longitude;
        }
        if (gps->altitude && below_sea_level) {
            *gps->altitude = -*gps->altitude;
        }
    }


    static ColorModel photometric_color_model(uint16_t photometric) noexcept
    {
        switch (photometric) {
        case 0:
        case 1: return ColorModel::Gray;
        case 2:
        case 3:
        case 6: return ColorModel::Rgb;
        case 5: return ColorModel::Cmyk;
        case 8:
        case 9:
        case 10: return ColorModel::Lab;
        default: return ColorModel::Unknown;
        }
    }


    static bool already_visited(uint64_t off,
                                std::span<const uint64_t> visited,
                                uint32_t count) noexcept
    {
        for (uint32_t i = 0; i < count; ++i) {
            if (visited[i] == off) {
                return true;
            }
        }
        return false;
    }

}  // namespace

ExifDecodeResult
decode_exif_tiff(std::span<const std::byte> tiff_bytes, MetadataModel& model,
                 const ExifDecodeOptions& options) noexcept
{
    ExifDecodeResult result;
    const ExifDecodeLimits& limits = options.limits;

    if (tiff_bytes.size() < 8) {
        result.status = ExifDecodeStatus::Malformed;
        return result;
    }

    TiffConfig cfg;
    const uint8_t b0 = u8(tiff_bytes[0]);
    const uint8_t b1 = u8(tiff_bytes[1]);
    if (b0 == 0x49 && b1 == 0x49) {
        cfg.le = true;
    } else if (b0 == 0x4D && b1 == 0x4D) {
        cfg.le = false;
    } else {
        result.status = ExifDecodeStatus::Unsupported;
        return result;
    }

    uint16_t version = 0;
    if (!read_tiff_u16(cfg, tiff_bytes, 2, &version)) {
        result.status = ExifDecodeStatus::Malformed;
        return result;
    }
    if (version == 42) {
        cfg.bigtiff = false;
    } else if (version == 43) {
        cfg.bigtiff = true;
    } else {
        result.status = ExifDecodeStatus::Unsupported;
        return result;
    }

    uint64_t ifd0_off = 0;
    if (!cfg.bigtiff) {
        uint32_t off32 = 0;
        if (!read_tiff_u32(cfg, tiff_bytes, 4, &off32)) {
            result.status = ExifDecodeStatus::Malformed;
            return result;
        }
        ifd0_off = off32;
    } else {
        uint16_t off_size = 0;
        uint16_t reserved = 0;
        if (!read_tiff_u16(cfg, tiff_bytes, 4, &off_size)
            || !read_tiff_u16(cfg, tiff_bytes, 6, &reserved)
            || off_size != 8 || reserved != 0
            || !read_tiff_u64(cfg, tiff_bytes, 8, &ifd0_off)) {
            result.status = ExifDecodeStatus::Malformed;
            return result;
        }
    }

    std::array<uint64_t, 3> visited {};
    uint32_t visited_count = 0;
    uint32_t total_entries = 0;
    std::vector<IfdEntry> entries;

    DeviceBlock device;
    TimestampBlock timestamps;
    CameraSettingsBlock camera;
    ResolutionBlock resolution;
    uint32_t resolution_tags = 0;
    std::optional<uint32_t> ifd0_width;
    std::optional<uint32_t> ifd0_height;
    std::optional<uint32_t> exif_width;
    std::optional<uint32_t> exif_height;
    uint64_t exif_ifd_off = 0;
    uint64_t gps_ifd_off  = 0;
    bool has_photometric  = false;

    if (read_ifd(cfg, tiff_bytes, ifd0_off, limits, &total_entries, &entries,
                 &result.ifd0_status)) {
        visited[visited_count++] = ifd0_off;
        result.ifds_decoded += 1;
        result.entries_decoded += static_cast<uint32_t>(entries.size());

        for (const IfdEntry& e : entries) {
            uint64_t v = 0;
            switch (e.tag) {
            case 0x0100:
                if (entry_uint(cfg, tiff_bytes, e, 0, &v) && v != 0
                    && v <= UINT32_MAX) {
                    ifd0_width = static_cast<uint32_t>(v);
                }
                break;
            case 0x0101:
                if (entry_uint(cfg, tiff_bytes, e, 0, &v) && v != 0
                    && v <= UINT32_MAX) {
                    ifd0_height = static_cast<uint32_t>(v);
                }
                break;
            case 0x0106:
                if (entry_uint(cfg, tiff_bytes, e, 0, &v) && v <= 0xFFFF) {
                    result.photometric = static_cast<uint16_t>(v);
                    has_photometric    = true;
                }
                break;
            case 0x010F:
                device.make = text_field(tiff_bytes, e, limits,
                                         &result.ifd0_status,
                                         &device.tag_count);
                break;
            case 0x0110:
                device.model = text_field(tiff_bytes, e, limits,
                                          &result.ifd0_status,
                                          &device.tag_count);
                break;
            case 0x0131:
                device.software = text_field(tiff_bytes, e, limits,
                                             &result.ifd0_status,
                                             &device.tag_count);
                break;
            case 0x0112:
                if (entry_uint(cfg, tiff_bytes, e, 0, &v)
                    && is_valid_orientation(static_cast<uint32_t>(v))) {
                    model.orientation = static_cast<uint16_t>(v);
                }
                break;
            case 0x011A:
                if (entry_rational(cfg, tiff_bytes, e, 0, &resolution.x)) {
                    resolution_tags += 1;
                }
                break;
            case 0x011B:
                if (entry_rational(cfg, tiff_bytes, e, 0, &resolution.y)) {
                    resolution_tags += 1;
                }
                break;
            case 0x0128:
                if (entry_uint(cfg, tiff_bytes, e, 0, &v) && v >= 1 && v <= 3) {
                    resolution.unit = static_cast<uint16_t>(v);
                    resolution_tags += 1;
                }
                break;
            case 0x0132:
                timestamps.modified = text_field(tiff_bytes, e, limits,
                                                 &result.ifd0_status,
                                                 &timestamps.tag_count);
                break;
            case 0x02BC:
                result.xmp_offset = e.value_off;
                result.xmp_size   = e.value_bytes;
                break;
            case 0x83BB:
                result.iptc_offset = e.value_off;
                result.iptc_size   = e.value_bytes;
                break;
            case 0x8769:
                if (entry_uint(cfg, tiff_bytes, e, 0, &v)) {
                    exif_ifd_off = v;
                }
                break;
            case 0x8825:
                if (entry_uint(cfg, tiff_bytes, e, 0, &v)) {
                    gps_ifd_off = v;
                }
                break;
            default: break;
            }
        }
    }

    if (exif_ifd_off != 0
        && !already_visited(exif_ifd_off, visited, visited_count)) {
        result.exif_ifd_found = true;
        if (read_ifd(cfg, tiff_bytes, exif_ifd_off, limits, &total_entries,
                     &entries, &result.exif_ifd_status)) {
            visited[visited_count++] = exif_ifd_off;
            result.ifds_decoded += 1;
            result.entries_decoded += static_cast<uint32_t>(entries.size());

            for (const IfdEntry& e : entries) {
                uint64_t v = 0;
                double d   = 0.0;
                switch (e.tag) {
                case 0x829A:
                    if (entry_rational(cfg, tiff_bytes, e, 0, &d)) {
                        camera.exposure_time = d;
                        camera.tag_count += 1;
                    }
                    break;
                case 0x829D:
                    if (entry_rational(cfg, tiff_bytes, e, 0, &d)) {
                        camera.f_number = d;
                        camera.tag_count += 1;
                    }
                    break;
                case 0x8827:
                    if (entry_uint(cfg, tiff_bytes, e, 0, &v)
                        && v <= UINT32_MAX) {
                        camera.iso = static_cast<uint32_t>(v);
                        camera.tag_count += 1;
                    }
                    break;
                case 0x920A:
                    if (entry_rational(cfg, tiff_bytes, e, 0, &d)) {
                        camera.focal_length = d;
                        camera.tag_count += 1;
                    }
                    break;
                case 0xA434:
                    camera.lens_model = text_field(tiff_bytes, e, limits,
                                                   &result.exif_ifd_status,
                                                   &camera.tag_count);
                    break;
                case 0x9003:
                    timestamps.original = text_field(tiff_bytes, e, limits,
                                                     &result.exif_ifd_status,
                                                     &timestamps.tag_count);
                    break;
                case 0x9004:
                    timestamps.digitized = text_field(tiff_bytes, e, limits,
                                                      &result.exif_ifd_status,
                                                      &timestamps.tag_count);
                    break;
                case 0xA002:
                    if (entry_uint(cfg, tiff_bytes, e, 0, &v) && v != 0
                        && v <= UINT32_MAX) {
                        exif_width = static_cast<uint32_t>(v);
                    }
                    break;
                case 0xA003:
                    if (entry_uint(cfg, tiff_bytes, e, 0, &v) && v != 0
                        && v <= UINT32_MAX) {
                        exif_height = static_cast<uint32_t>(v);
                    }
                    break;
                case 0xA431:
                    device.serial_number = text_field(tiff_bytes, e, limits,
                                                      &result.exif_ifd_status,
                                                      &device.tag_count);
                    break;
                default: break;
                }
            }
        }
    }

    if (gps_ifd_off != 0
        && !already_visited(gps_ifd_off, visited, visited_count)) {
        result.gps_ifd_found = true;
        if (read_ifd(cfg, tiff_bytes, gps_ifd_off, limits, &total_entries,
                     &entries, &result.gps_ifd_status)) {
            visited[visited_count++] = gps_ifd_off;
            result.ifds_decoded += 1;
            result.entries_decoded += static_cast<uint32_t>(entries.size());

            GpsBlock gps;
            decode_gps_ifd(cfg, tiff_bytes, entries, limits,
                           &result.gps_ifd_status, &gps);
            model.gps = std::move(gps);
        }
    }

    if (device.tag_count > 0) {
        model.device = std::move(device);
    }
    if (timestamps.tag_count > 0) {
        model.timestamps = std::move(timestamps);
    }
    if (camera.tag_count > 0) {
        model.camera_settings = std::move(camera);
    }
    if (resolution_tags > 0) {
        model.resolution = resolution;
    }
    // Exif IFD dimensions win over the IFD0 image size, per axis.
    if (exif_width || ifd0_width) {
        model.pixel_width = exif_width ? exif_width : ifd0_width;
    }
    if (exif_height || ifd0_height) {
        model.pixel_height = exif_height ? exif_height : ifd0_height;
    }
    if (model.color_model == ColorModel::Unknown && has_photometric) {
        model.color_model = photometric_color_model(result.photometric);
    }

    update_status(&result.status, result.ifd0_status);
    update_status(&result.status, result.exif_ifd_status);
    update_status(&result.status, result.gps_ifd_status);
    return result;
}


const char*
exif_decode_status_name(ExifDecodeStatus status) noexcept
{
    switch (status) {
    case ExifDecodeStatus::Ok: return "ok";
    case ExifDecodeStatus::Unsupported: return "unsupported";
    case ExifDecodeStatus::Malformed: return "malformed";
    case ExifDecodeStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace safemeta
