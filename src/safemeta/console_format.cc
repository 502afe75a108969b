#include "safemeta/console_format.h"

#include <cstdio>

namespace safemeta {
namespace {

    static void append_text_line(std::string* out, const char* key,
                                 const std::optional<std::string>& value,
                                 uint32_t max_bytes) noexcept
    {
        if (!value) {
            return;
        }
        out->append("  ");
        out->append(key);
        out->append("=\"");
        (void)append_console_escaped_ascii(*value, max_bytes, out);
        out->append("\"\n");
    }


    static void append_number_line(std::string* out, const char* key,
                                   const std::optional<double>& value,
                                   const char* fmt) noexcept
    {
        if (!value) {
            return;
        }
        char buf[64];
        std::snprintf(buf, sizeof(buf), fmt, *value);
        out->append("  ");
        out->append(key);
        out->append("=");
        out->append(buf);
        out->append("\n");
    }


    static void append_flag(std::string* out, const char* key, bool value,
                            bool first) noexcept
    {
        if (!first) {
            out->push_back(' ');
        }
        out->append(key);
        out->append(value ? "=1" : "=0");
    }

}  // namespace

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool dangerous   = false;
    const uint32_t n = (max_bytes == 0U || s.size() < max_bytes)
                           ? static_cast<uint32_t>(s.size())
                           : max_bytes;

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
        case '\\':
        case '"':
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        case '\n': out->append("\\n"); dangerous = true; continue;
        case '\r': out->append("\\r"); dangerous = true; continue;
        case '\t': out->append("\\t"); dangerous = true; continue;
        default: break;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            dangerous = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        dangerous = true;
    }
    return dangerous;
}


void
append_privacy_flags(const PrivacyAnalysis& a, std::string* out) noexcept
{
    append_flag(out, "gps", a.has_gps_data, true);
    append_flag(out, "exact_location", a.has_exact_location, false);
    append_flag(out, "device", a.has_device_info, false);
    append_flag(out, "timestamps", a.has_timestamps, false);
    append_flag(out, "camera", a.has_camera_settings, false);
    append_flag(out, "iptc", a.has_iptc_data, false);
}


void
append_sensitive_fields(const MetadataModel& model, uint32_t max_value_bytes,
                        std::string* out) noexcept
{
    if (model.gps) {
        const GpsBlock& g = *model.gps;
        append_number_line(out, "gps.latitude", g.latitude, "%.6f");
        append_number_line(out, "gps.longitude", g.longitude, "%.6f");
        append_number_line(out, "gps.altitude", g.altitude, "%.1f");
        append_text_line(out, "gps.time_stamp", g.time_stamp, max_value_bytes);
        append_text_line(out, "gps.date_stamp", g.date_stamp, max_value_bytes);
    }
    if (model.device) {
        const DeviceBlock& d = *model.device;
        append_text_line(out, "device.make", d.make, max_value_bytes);
        append_text_line(out, "device.model", d.model, max_value_bytes);
        append_text_line(out, "device.software", d.software, max_value_bytes);
        append_text_line(out, "device.serial_number", d.serial_number,
                         max_value_bytes);
    }
    if (model.timestamps) {
        const TimestampBlock& t = *model.timestamps;
        append_text_line(out, "timestamps.original", t.original,
                         max_value_bytes);
        append_text_line(out, "timestamps.digitized", t.digitized,
                         max_value_bytes);
        append_text_line(out, "timestamps.modified", t.modified,
                         max_value_bytes);
    }
    if (model.camera_settings) {
        const CameraSettingsBlock& c = *model.camera_settings;
        append_text_line(out, "camera.lens_model", c.lens_model,
                         max_value_bytes);
        if (c.iso) {
            out->append("  camera.iso=");
            out->append(std::to_string(*c.iso));
            out->append("\n");
        }
    }
    if (model.caption) {
        const CaptionBlock& cap = *model.caption;
        append_text_line(out, "caption.object_name", cap.object_name,
                         max_value_bytes);
        append_text_line(out, "caption.headline", cap.headline,
                         max_value_bytes);
        append_text_line(out, "caption.caption", cap.caption, max_value_bytes);
        append_text_line(out, "caption.by_line", cap.by_line, max_value_bytes);
        append_text_line(out, "caption.city", cap.city, max_value_bytes);
        append_text_line(out, "caption.country", cap.country, max_value_bytes);
        append_text_line(out, "caption.copyright", cap.copyright,
                         max_value_bytes);
        for (const std::string& kw : cap.keywords) {
            out->append("  caption.keyword=\"");
            (void)append_console_escaped_ascii(kw, max_value_bytes, out);
            out->append("\"\n");
        }
    }
}

}  // namespace safemeta
