#include "safemeta/xmp_decode.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(SAFEMETA_HAS_EXPAT) && SAFEMETA_HAS_EXPAT
#    include <expat.h>
#endif

namespace safemeta {
namespace {

    static bool contains_byte(std::span<const std::byte> bytes,
                              unsigned char needle) noexcept
    {
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (static_cast<unsigned char>(std::to_integer<uint8_t>(bytes[i]))
                == needle) {
                return true;
            }
        }
        return false;
    }


#if defined(SAFEMETA_HAS_EXPAT) && SAFEMETA_HAS_EXPAT

    // Fills categories and rendering fields of `dst` that are still absent.
    static void merge_absent(MetadataModel* dst, MetadataModel* src)
    {
        if (!dst->orientation) {
            dst->orientation = src->orientation;
        }
        if (!dst->pixel_width) {
            dst->pixel_width = src->pixel_width;
        }
        if (!dst->pixel_height) {
            dst->pixel_height = src->pixel_height;
        }
        if (!dst->resolution) {
            dst->resolution = src->resolution;
        }
        if (!dst->gps) {
            dst->gps = std::move(src->gps);
        }
        if (!dst->device) {
            dst->device = std::move(src->device);
        }
        if (!dst->timestamps) {
            dst->timestamps = std::move(src->timestamps);
        }
        if (!dst->camera_settings) {
            dst->camera_settings = std::move(src->camera_settings);
        }
        if (!dst->caption) {
            dst->caption = std::move(src->caption);
        }
    }

    static constexpr std::string_view kRdfNs
        = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    static constexpr std::string_view kXmlNs
        = "http://www.w3.org/XML/1998/namespace";

    static constexpr std::string_view kExifNs
        = "http://ns.adobe.com/exif/1.0/";
    static constexpr std::string_view kExifExNs = "http://cipa.jp/exif/1.0/";
    static constexpr std::string_view kAuxNs
        = "http://ns.adobe.com/exif/1.0/aux/";
    static constexpr std::string_view kTiffNs
        = "http://ns.adobe.com/tiff/1.0/";
    static constexpr std::string_view kXmpNs = "http://ns.adobe.com/xap/1.0/";
    static constexpr std::string_view kPhotoshopNs
        = "http://ns.adobe.com/photoshop/1.0/";
    static constexpr std::string_view kDcNs
        = "http://purl.org/dc/elements/1.1/";
    static constexpr std::string_view kIptcCoreNs
        = "http://iptc.org/std/Iptc4xmpCore/1.0/xmlns/";
    static constexpr std::string_view kIptcExtNs
        = "http://iptc.org/std/Iptc4xmpExt/2008-02-29/";

    struct NameParts final {
        std::string_view uri;
        std::string_view local;
    };

    static NameParts split_name(std::string_view name) noexcept
    {
        const size_t sep = name.find('|');
        if (sep == std::string_view::npos) {
            return NameParts { std::string_view {}, name };
        }
        return NameParts { name.substr(0, sep), name.substr(sep + 1) };
    }


    static bool is_ascii_ws(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }


    static std::string_view trim_ascii_ws(std::string_view s) noexcept
    {
        size_t b = 0;
        while (b < s.size() && is_ascii_ws(s[b])) {
            b += 1;
        }
        size_t e = s.size();
        while (e > b && is_ascii_ws(s[e - 1])) {
            e -= 1;
        }
        return s.substr(b, e - b);
    }


    static void merge_status(XmpDecodeResult* out, XmpDecodeStatus in) noexcept
    {
        if (in == XmpDecodeStatus::Ok
            || out->status == XmpDecodeStatus::LimitExceeded) {
            return;
        }
        if (in == XmpDecodeStatus::LimitExceeded) {
            out->status = in;
            return;
        }
        if (out->status == XmpDecodeStatus::Malformed) {
            return;
        }
        if (in == XmpDecodeStatus::Malformed) {
            out->status = in;
            return;
        }
        if (out->status == XmpDecodeStatus::Ok) {
            out->status = in;
        }
    }


    // Parses "123", "12.5" or "num/den".
    static bool parse_number(std::string_view s, double* out)
    {
        const std::string text(s);
        const size_t slash = text.find('/');
        char* end          = nullptr;
        if (slash == std::string::npos) {
            const double v = std::strtod(text.c_str(), &end);
            if (end == text.c_str() || !std::isfinite(v)) {
                return false;
            }
            *out = v;
            return true;
        }
        const std::string num_text = text.substr(0, slash);
        const std::string den_text = text.substr(slash + 1);
        const double num           = std::strtod(num_text.c_str(), &end);
        if (end == num_text.c_str()) {
            return false;
        }
        const double den = std::strtod(den_text.c_str(), &end);
        if (end == den_text.c_str() || den == 0.0) {
            return false;
        }
        *out = num / den;
        return std::isfinite(*out);
    }


    static bool parse_uint(std::string_view s, uint32_t* out)
    {
        double v = 0.0;
        if (!parse_number(s, &v) || v < 0.0 || v > 4294967295.0) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    // XMP GPSCoordinate: "DDD,MM,SSk" or "DDD,MM.mmk" with k in N/S/E/W.
    static bool parse_gps_coordinate(std::string_view s, double* out)
    {
        if (s.size() < 2) {
            return false;
        }
        const char ref        = s.back();
        std::string_view body = s.substr(0, s.size() - 1);

        double parts[3] = { 0.0, 0.0, 0.0 };
        uint32_t n      = 0;
        while (!body.empty() && n < 3) {
            const size_t comma         = body.find(',');
            const std::string_view seg = body.substr(0, comma);
            if (!parse_number(seg, &parts[n])) {
                return false;
            }
            n += 1;
            if (comma == std::string_view::npos) {
                break;
            }
            body = body.substr(comma + 1);
        }
        if (n == 0) {
            return false;
        }
        double v = parts[0] + parts[1] / 60.0 + parts[2] / 3600.0;
        if (ref == 'S' || ref == 's' || ref == 'W' || ref == 'w') {
            v = -v;
        } else if (ref != 'N' && ref != 'n' && ref != 'E' && ref != 'e') {
            return false;
        }
        *out = v;
        return true;
    }


    static void set_first(std::optional<std::string>* field,
                          std::string_view value)
    {
        if (!*field) {
            *field = std::string(value);
        }
    }


    struct Frame final {
        bool is_description       = false;
        bool is_li                = false;
        bool is_nonrdf            = false;
        bool starts_property      = false;
        bool had_child_element    = false;
        bool emitted_resource_val = false;
        std::string text;
    };

    struct Ctx final {
        XmpDecodeOptions options;
        XmpDecodeResult result;
        XML_Parser parser = nullptr;

        uint32_t description_depth = 0;
        uint64_t total_value_bytes = 0;

        // Top-level property currently open (empty when none).
        std::string prop_ns;
        std::string prop_local;

        MetadataModel model;
        GpsBlock gps;
        DeviceBlock device;
        TimestampBlock timestamps;
        CameraSettingsBlock camera;
        CaptionBlock caption;
        bool altitude_below_sea_level = false;

        std::vector<Frame> stack;
    };

    static bool should_stop(const Ctx* ctx) noexcept
    {
        return !ctx || !ctx->parser
               || ctx->result.status == XmpDecodeStatus::LimitExceeded
               || ctx->result.status == XmpDecodeStatus::Malformed;
    }


    static void stop_parser(Ctx* ctx, XmpDecodeStatus status) noexcept
    {
        merge_status(&ctx->result, status);
        if (ctx->parser) {
            XML_StopParser(ctx->parser, XML_FALSE);
        }
    }


    static void apply_exif(Ctx* ctx, std::string_view local,
                           std::string_view value)
    {
        if (local.substr(0, 3) == "GPS") {
            ctx->gps.tag_count += 1;
            double v = 0.0;
            if (local == "GPSLatitude" && parse_gps_coordinate(value, &v)) {
                ctx->gps.latitude = v;
            } else if (local == "GPSLongitude"
                       && parse_gps_coordinate(value, &v)) {
                ctx->gps.longitude = v;
            } else if (local == "GPSAltitude" && parse_number(value, &v)) {
                ctx->gps.altitude = v;
            } else if (local == "GPSAltitudeRef") {
                ctx->altitude_below_sea_level = (value == "1");
            } else if (local == "GPSTimeStamp") {
                set_first(&ctx->gps.time_stamp, value);
            }
            return;
        }

        double d   = 0.0;
        uint32_t u = 0;
        if (local == "DateTimeOriginal") {
            set_first(&ctx->timestamps.original, value);
        } else if (local == "DateTimeDigitized") {
            set_first(&ctx->timestamps.digitized, value);
        } else if (local == "ISOSpeedRatings" || local == "ISOSpeed") {
            if (!ctx->camera.iso && parse_uint(value, &u)) {
                ctx->camera.iso = u;
                ctx->camera.tag_count += 1;
            }
        } else if (local == "ExposureTime" && parse_number(value, &d)) {
            ctx->camera.exposure_time = d;
            ctx->camera.tag_count += 1;
        } else if (local == "FNumber" && parse_number(value, &d)) {
            ctx->camera.f_number = d;
            ctx->camera.tag_count += 1;
        } else if (local == "FocalLength" && parse_number(value, &d)) {
            ctx->camera.focal_length = d;
            ctx->camera.tag_count += 1;
        } else if (local == "PixelXDimension" && parse_uint(value, &u)
                   && u != 0) {
            ctx->model.pixel_width = u;
        } else if (local == "PixelYDimension" && parse_uint(value, &u)
                   && u != 0) {
            ctx->model.pixel_height = u;
        }
    }


    static void apply_tiff(Ctx* ctx, std::string_view local,
                           std::string_view value)
    {
        uint32_t u = 0;
        double d   = 0.0;
        if (local == "Make") {
            set_first(&ctx->device.make, value);
        } else if (local == "Model") {
            set_first(&ctx->device.model, value);
        } else if (local == "Software") {
            set_first(&ctx->device.software, value);
        } else if (local == "DateTime") {
            set_first(&ctx->timestamps.modified, value);
        } else if (local == "Orientation") {
            if (parse_uint(value, &u) && is_valid_orientation(u)) {
                ctx->model.orientation = static_cast<uint16_t>(u);
            }
        } else if (local == "ImageWidth") {
            if (!ctx->model.pixel_width && parse_uint(value, &u) && u != 0) {
                ctx->model.pixel_width = u;
            }
        } else if (local == "ImageLength") {
            if (!ctx->model.pixel_height && parse_uint(value, &u) && u != 0) {
                ctx->model.pixel_height = u;
            }
        } else if (local == "XResolution" && parse_number(value, &d)) {
            ctx->model.resolution = ctx->model.resolution.value_or(
                ResolutionBlock {});
            ctx->model.resolution->x = d;
        } else if (local == "YResolution" && parse_number(value, &d)) {
            ctx->model.resolution = ctx->model.resolution.value_or(
                ResolutionBlock {});
            ctx->model.resolution->y = d;
        } else if (local == "ResolutionUnit" && parse_uint(value, &u)
                   && u >= 1 && u <= 3) {
            ctx->model.resolution = ctx->model.resolution.value_or(
                ResolutionBlock {});
            ctx->model.resolution->unit = static_cast<uint16_t>(u);
        }
    }


    static bool is_technical_photoshop_property(std::string_view local) noexcept
    {
        return local == "ColorMode" || local == "ICCProfile"
               || local == "History" || local == "DocumentAncestors"
               || local == "LegacyIPTCDigest";
    }


    static void emit_property_text(Ctx* ctx, std::string_view ns,
                                   std::string_view local,
                                   std::string_view value)
    {
        if (ctx->result.properties_decoded
            >= ctx->options.limits.max_properties) {
            stop_parser(ctx, XmpDecodeStatus::LimitExceeded);
            return;
        }
        ctx->result.properties_decoded += 1;

        if (ns == kExifNs) {
            apply_exif(ctx, local, value);
        } else if (ns == kTiffNs) {
            apply_tiff(ctx, local, value);
        } else if (ns == kExifExNs) {
            uint32_t u = 0;
            if (local == "LensModel") {
                set_first(&ctx->camera.lens_model, value);
            } else if (local == "BodySerialNumber") {
                set_first(&ctx->device.serial_number, value);
            } else if (local == "PhotographicSensitivity" && !ctx->camera.iso
                       && parse_uint(value, &u)) {
                ctx->camera.iso = u;
                ctx->camera.tag_count += 1;
            }
        } else if (ns == kAuxNs) {
            if (local == "Lens") {
                set_first(&ctx->camera.lens_model, value);
            } else if (local == "SerialNumber") {
                set_first(&ctx->device.serial_number, value);
            }
        } else if (ns == kXmpNs) {
            if (local == "CreatorTool") {
                set_first(&ctx->device.software, value);
            } else if (local == "CreateDate") {
                set_first(&ctx->timestamps.digitized, value);
            } else if (local == "ModifyDate") {
                set_first(&ctx->timestamps.modified, value);
            }
        } else if (ns == kPhotoshopNs) {
            if (is_technical_photoshop_property(local)) {
                return;
            }
            ctx->caption.dataset_count += 1;
            if (local == "Headline") {
                set_first(&ctx->caption.headline, value);
            } else if (local == "City") {
                set_first(&ctx->caption.city, value);
            } else if (local == "Country") {
                set_first(&ctx->caption.country, value);
            } else if (local == "DateCreated") {
                set_first(&ctx->timestamps.original, value);
            }
        } else if (ns == kDcNs) {
            if (local == "format") {
                return;
            }
            ctx->caption.dataset_count += 1;
            if (local == "title") {
                set_first(&ctx->caption.object_name, value);
            } else if (local == "description") {
                set_first(&ctx->caption.caption, value);
            } else if (local == "creator") {
                set_first(&ctx->caption.by_line, value);
            } else if (local == "rights") {
                set_first(&ctx->caption.copyright, value);
            } else if (local == "subject") {
                ctx->caption.keywords.emplace_back(value);
            }
        } else if (ns == kIptcCoreNs || ns == kIptcExtNs) {
            ctx->caption.dataset_count += 1;
        }
    }


    static void XMLCALL start_element(void* user_data, const XML_Char* name_c,
                                      const XML_Char** atts)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (should_stop(ctx) || !name_c) {
            return;
        }
        if (ctx->stack.size() >= ctx->options.limits.max_depth) {
            stop_parser(ctx, XmpDecodeStatus::LimitExceeded);
            return;
        }
        if (!ctx->stack.empty()) {
            ctx->stack.back().had_child_element = true;
        }

        const std::string_view name(name_c, std::strlen(name_c));
        const NameParts parts = split_name(name);
        const bool is_rdf     = (parts.uri == kRdfNs);
        const bool is_xml     = (parts.uri == kXmlNs);

        Frame frame;
        frame.is_description = is_rdf && (parts.local == "Description");
        frame.is_li          = is_rdf && (parts.local == "li");
        frame.is_nonrdf      = (!is_rdf && !is_xml);

        if (frame.is_description) {
            ctx->description_depth += 1;
        }

        if (ctx->description_depth > 0 && frame.is_nonrdf
            && ctx->prop_local.empty()) {
            ctx->prop_ns.assign(parts.uri.data(), parts.uri.size());
            ctx->prop_local.assign(parts.local.data(), parts.local.size());
            frame.starts_property = true;
        }

        if (atts && ctx->description_depth > 0) {
            for (int i = 0; atts[i] && atts[i + 1]; i += 2) {
                const std::string_view an(atts[i], std::strlen(atts[i]));
                const NameParts ap = split_name(an);
                const std::string_view av = trim_ascii_ws(
                    std::string_view(atts[i + 1], std::strlen(atts[i + 1])));

                if (ap.uri == kRdfNs && ap.local == "resource"
                    && !ctx->prop_local.empty()) {
                    // The property value is given by rdf:resource.
                    emit_property_text(ctx, ctx->prop_ns, ctx->prop_local, av);
                    frame.emitted_resource_val = true;
                    continue;
                }
                if (ap.uri.empty() || ap.uri == kRdfNs || ap.uri == kXmlNs) {
                    continue;
                }
                if (frame.is_description && ctx->prop_local.empty()) {
                    // Attribute shorthand for a top-level property.
                    emit_property_text(ctx, ap.uri, ap.local, av);
                } else if (!ctx->prop_local.empty()) {
                    // Struct field shorthand inside an open property.
                    emit_property_text(ctx, ctx->prop_ns, ctx->prop_local, av);
                }
                if (should_stop(ctx)) {
                    return;
                }
            }
        }

        ctx->stack.push_back(std::move(frame));
    }


    static void XMLCALL end_element(void* user_data, const XML_Char* /*name_c*/)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (should_stop(ctx)) {
            return;
        }
        if (ctx->stack.empty()) {
            stop_parser(ctx, XmpDecodeStatus::Malformed);
            return;
        }

        Frame frame = std::move(ctx->stack.back());
        ctx->stack.pop_back();

        // Emit element/li text values (leaf-only).
        if (!ctx->prop_local.empty() && !frame.emitted_resource_val
            && !frame.had_child_element && (frame.is_li || frame.is_nonrdf)) {
            const std::string_view trimmed = trim_ascii_ws(frame.text);
            if (!trimmed.empty()) {
                emit_property_text(ctx, ctx->prop_ns, ctx->prop_local,
                                   trimmed);
            }
        }

        if (frame.starts_property) {
            ctx->prop_ns.clear();
            ctx->prop_local.clear();
        }

        if (frame.is_description) {
            if (ctx->description_depth == 0) {
                stop_parser(ctx, XmpDecodeStatus::Malformed);
                return;
            }
            ctx->description_depth -= 1;
        }
    }


    static void XMLCALL char_data(void* user_data, const XML_Char* s, int len)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (should_stop(ctx) || !s || len <= 0 || ctx->stack.empty()
            || ctx->prop_local.empty()) {
            return;
        }

        Frame& frame = ctx->stack.back();
        if ((!frame.is_li && !frame.is_nonrdf) || frame.emitted_resource_val) {
            return;
        }

        const uint32_t max_val   = ctx->options.limits.max_value_bytes;
        const uint64_t max_total = ctx->options.limits.max_total_value_bytes;

        const uint64_t have = static_cast<uint64_t>(frame.text.size());
        uint64_t take       = static_cast<uint64_t>(len);
        if (max_val != 0U) {
            const uint64_t avail = (have < max_val) ? (max_val - have) : 0U;
            if (take > avail) {
                take = avail;
            }
        }
        if (take == 0) {
            return;
        }
        if (max_total != 0U && ctx->total_value_bytes + take > max_total) {
            stop_parser(ctx, XmpDecodeStatus::LimitExceeded);
            return;
        }
        ctx->total_value_bytes += take;
        frame.text.append(s, static_cast<size_t>(take));
    }


    static void finish_model(Ctx* ctx)
    {
        if (ctx->gps.altitude && ctx->altitude_below_sea_level) {
            *ctx->gps.altitude = -*ctx->gps.altitude;
        }
        if (ctx->gps.tag_count > 0) {
            ctx->model.gps = std::move(ctx->gps);
        }
        const DeviceBlock& d = ctx->device;
        ctx->device.tag_count = static_cast<uint32_t>(d.make.has_value())
                                + static_cast<uint32_t>(d.model.has_value())
                                + static_cast<uint32_t>(d.software.has_value())
                                + static_cast<uint32_t>(
                                    d.serial_number.has_value());
        if (ctx->device.tag_count > 0) {
            ctx->model.device = std::move(ctx->device);
        }
        const TimestampBlock& t = ctx->timestamps;
        ctx->timestamps.tag_count
            = static_cast<uint32_t>(t.original.has_value())
              + static_cast<uint32_t>(t.digitized.has_value())
              + static_cast<uint32_t>(t.modified.has_value());
        if (ctx->timestamps.tag_count > 0) {
            ctx->model.timestamps = std::move(ctx->timestamps);
        }
        if (ctx->camera.lens_model) {
            ctx->camera.tag_count += 1;
        }
        if (ctx->camera.tag_count > 0) {
            ctx->model.camera_settings = std::move(ctx->camera);
        }
        if (ctx->caption.dataset_count > 0) {
            ctx->model.caption = std::move(ctx->caption);
        }
    }

#endif  // SAFEMETA_HAS_EXPAT

}  // namespace

XmpDecodeResult
decode_xmp_packet(std::span<const std::byte> xmp_bytes, MetadataModel& model,
                  const XmpDecodeOptions& options) noexcept
{
    XmpDecodeResult result;

    if (xmp_bytes.empty()
        || !contains_byte(xmp_bytes, static_cast<unsigned char>('<'))) {
        result.status = XmpDecodeStatus::Unsupported;
        return result;
    }

    const uint64_t max_in = options.limits.max_input_bytes;
    if (max_in != 0U && xmp_bytes.size() > max_in) {
        result.status = XmpDecodeStatus::LimitExceeded;
        return result;
    }

#if defined(SAFEMETA_HAS_EXPAT) && SAFEMETA_HAS_EXPAT
    if (xmp_bytes.size() > static_cast<size_t>(INT32_MAX)) {
        result.status = XmpDecodeStatus::LimitExceeded;
        return result;
    }

    Ctx ctx;
    ctx.options = options;
    ctx.stack.reserve(options.limits.max_depth);

    ctx.parser = XML_ParserCreateNS(nullptr, '|');
    if (!ctx.parser) {
        result.status = XmpDecodeStatus::Malformed;
        return result;
    }

    XML_SetUserData(ctx.parser, &ctx);
    XML_SetElementHandler(ctx.parser, &start_element, &end_element);
    XML_SetCharacterDataHandler(ctx.parser, &char_data);

    const char* data = reinterpret_cast<const char*>(xmp_bytes.data());
    const int size   = static_cast<int>(xmp_bytes.size());
    const XML_Status st = XML_Parse(ctx.parser, data, size, XML_TRUE);
    if (st == XML_STATUS_ERROR) {
        // Treat "not XML" as Unsupported, otherwise Malformed.
        const enum XML_Error err = XML_GetErrorCode(ctx.parser);
        if (err == XML_ERROR_SYNTAX || err == XML_ERROR_NO_ELEMENTS) {
            merge_status(&ctx.result, XmpDecodeStatus::Unsupported);
        } else {
            merge_status(&ctx.result, XmpDecodeStatus::Malformed);
        }
    }

    XML_ParserFree(ctx.parser);
    ctx.parser = nullptr;

    result = ctx.result;
    if (result.status == XmpDecodeStatus::Ok) {
        finish_model(&ctx);
        merge_absent(&model, &ctx.model);
    }
    return result;
#else
    (void)model;
    (void)options;
    result.status = XmpDecodeStatus::Unsupported;
    return result;
#endif
}


const char*
xmp_decode_status_name(XmpDecodeStatus status) noexcept
{
    switch (status) {
    case XmpDecodeStatus::Ok: return "ok";
    case XmpDecodeStatus::Unsupported: return "unsupported";
    case XmpDecodeStatus::Malformed: return "malformed";
    case XmpDecodeStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace safemeta
