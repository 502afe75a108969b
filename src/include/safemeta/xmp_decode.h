#pragma once

#include "safemeta/metadata_model.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file xmp_decode.h
 * \brief Decoder for XMP packets (RDF/XML) into the typed \ref MetadataModel.
 */

namespace safemeta {

/// XMP decode result status.
enum class XmpDecodeStatus : uint8_t {
    Ok,
    /// Not XML, or the library was built without expat.
    Unsupported,
    Malformed,
    LimitExceeded,
};

/// Resource limits applied during XMP decode to bound hostile inputs.
struct XmpDecodeLimits final {
    uint32_t max_depth      = 128;
    uint32_t max_properties = 65536;

    /// Caps the input XMP packet size (0 = unlimited).
    uint64_t max_input_bytes = 16ULL * 1024ULL * 1024ULL;

    /// Max text bytes kept per decoded value; longer values are cut.
    uint32_t max_value_bytes = 64U * 1024U;

    /// Max total text bytes accumulated across values (0 = unlimited).
    uint64_t max_total_value_bytes = 16ULL * 1024ULL * 1024ULL;
};

/// Decoder options for \ref decode_xmp_packet.
struct XmpDecodeOptions final {
    XmpDecodeLimits limits;
};

struct XmpDecodeResult final {
    XmpDecodeStatus status       = XmpDecodeStatus::Ok;
    uint32_t properties_decoded  = 0;
};

/**
 * \brief Decodes an XMP packet into \p model.
 *
 * Recognized schemas are mapped onto the model categories:
 * - `exif:GPS*` -> \ref GpsBlock
 * - `tiff:Make`, `tiff:Model`, `tiff:Software`, `xmp:CreatorTool`,
 *   `exifEX:BodySerialNumber`, `aux:SerialNumber` -> \ref DeviceBlock
 * - `exif:DateTimeOriginal`, `exif:DateTimeDigitized`, `xmp:CreateDate`,
 *   `xmp:ModifyDate`, `photoshop:DateCreated` -> \ref TimestampBlock
 * - `exif:ISOSpeedRatings`, `exifEX:LensModel`, exposure values
 *   -> \ref CameraSettingsBlock
 * - `dc:*`, `photoshop:*`, `Iptc4xmpCore:*`, `Iptc4xmpExt:*` -> \ref CaptionBlock
 * - `tiff:Orientation`, dimensions and resolution -> rendering fields
 *
 * Fields already present in \p model are not overwritten, so a caller that
 * decodes EXIF first keeps EXIF precedence.
 *
 * Requires expat (`SAFEMETA_HAS_EXPAT`); without it the decoder returns
 * \ref XmpDecodeStatus::Unsupported and leaves \p model untouched.
 */
XmpDecodeResult
decode_xmp_packet(std::span<const std::byte> xmp_bytes, MetadataModel& model,
                  const XmpDecodeOptions& options = XmpDecodeOptions {}) noexcept;

/// Returns a short, stable name ("ok", "malformed", ...).
const char*
xmp_decode_status_name(XmpDecodeStatus status) noexcept;

}  // namespace safemeta
