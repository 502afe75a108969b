#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * \file metadata_model.h
 * \brief Typed model of the metadata fields SafeMeta classifies or preserves.
 */

namespace safemeta {

/// Pixel color model declared by the container's pixel header.
enum class ColorModel : uint8_t {
    Unknown,
    Rgb,
    Gray,
    Cmyk,
    Lab,
};

/// GPS sub-block (EXIF GPS IFD or XMP `exif:GPS*` properties).
struct GpsBlock final {
    /// Decimal degrees, negative for southern latitudes.
    std::optional<double> latitude;
    /// Decimal degrees, negative for western longitudes.
    std::optional<double> longitude;
    /// Meters, negative below sea level.
    std::optional<double> altitude;
    /// GPSTimeStamp, "HH:MM:SS" (UTC).
    std::optional<std::string> time_stamp;
    /// GPSDateStamp, "YYYY:MM:DD".
    std::optional<std::string> date_stamp;
    /// Number of GPS tags/properties read, including unmodeled ones.
    uint32_t tag_count = 0;
};

/// Device identification (TIFF Make/Model/Software, EXIF BodySerialNumber).
struct DeviceBlock final {
    std::optional<std::string> make;
    std::optional<std::string> model;
    std::optional<std::string> software;
    std::optional<std::string> serial_number;
    uint32_t tag_count = 0;
};

/// Capture and modification timestamps ("YYYY:MM:DD HH:MM:SS" as stored).
struct TimestampBlock final {
    std::optional<std::string> original;
    std::optional<std::string> digitized;
    /// TIFF DateTime (last modification). Tracked, not classified.
    std::optional<std::string> modified;
    uint32_t tag_count = 0;
};

/// Exposure and lens settings.
struct CameraSettingsBlock final {
    std::optional<std::string> lens_model;
    std::optional<uint32_t> iso;
    /// Seconds.
    std::optional<double> exposure_time;
    std::optional<double> f_number;
    /// Millimeters.
    std::optional<double> focal_length;
    uint32_t tag_count = 0;
};

/// Embedded caption block (IPTC-IIM record 2 or the equivalent XMP schemas).
struct CaptionBlock final {
    std::optional<std::string> object_name;
    std::optional<std::string> headline;
    std::optional<std::string> caption;
    std::optional<std::string> by_line;
    std::optional<std::string> city;
    std::optional<std::string> country;
    std::optional<std::string> copyright;
    std::vector<std::string> keywords;
    /// Number of application datasets/properties read, including unmodeled ones.
    uint32_t dataset_count = 0;
};

/// Resolution as stored in TIFF tags.
struct ResolutionBlock final {
    /// TIFF ResolutionUnit: 1 = none, 2 = inch, 3 = centimeter.
    uint16_t unit = 2;
    double x      = 0.0;
    double y      = 0.0;
};

/**
 * \brief Metadata of one image instance.
 *
 * Every category is an independent optional: a disengaged optional means the
 * category was not found, an engaged one with a zero count means it was
 * found but carried nothing. The model never holds pixel data.
 */
struct MetadataModel final {
    /// EXIF orientation, 1..8.
    std::optional<uint16_t> orientation;
    std::optional<uint32_t> pixel_width;
    std::optional<uint32_t> pixel_height;
    ColorModel color_model = ColorModel::Unknown;

    std::optional<ResolutionBlock> resolution;
    std::optional<GpsBlock> gps;
    std::optional<DeviceBlock> device;
    std::optional<TimestampBlock> timestamps;
    std::optional<CameraSettingsBlock> camera_settings;
    std::optional<CaptionBlock> caption;
};

/// Returns true for the eight orientations defined by EXIF/TIFF.
constexpr bool
is_valid_orientation(uint32_t value) noexcept
{
    return value >= 1U && value <= 8U;
}

/// Returns a short, stable name ("RGB", "Gray", "CMYK", "Lab", "unknown").
const char*
color_model_name(ColorModel model) noexcept;

/// True when no category and no rendering field is present.
bool
is_empty(const MetadataModel& model) noexcept;

}  // namespace safemeta
