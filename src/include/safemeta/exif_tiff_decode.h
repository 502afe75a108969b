#pragma once

#include "safemeta/metadata_model.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file exif_tiff_decode.h
 * \brief Decoder for TIFF-IFD tag streams (EXIF blobs and TIFF files) into
 * the typed \ref MetadataModel.
 */

namespace safemeta {

/// EXIF/TIFF decode result status.
enum class ExifDecodeStatus : uint8_t {
    Ok,
    Unsupported,
    Malformed,
    LimitExceeded,
};

/// Resource limits applied during decode to bound hostile inputs.
struct ExifDecodeLimits final {
    uint32_t max_entries_per_ifd = 4096;
    uint32_t max_total_entries   = 16384;
    /// Upper bound for a single ASCII value that is copied into the model.
    uint64_t max_string_bytes = 64ULL * 1024ULL;
};

/// Decoder options for \ref decode_exif_tiff.
struct ExifDecodeOptions final {
    ExifDecodeLimits limits;
};

/// Aggregated decode statistics.
struct ExifDecodeResult final {
    /// Worst status across the header and all IFDs.
    ExifDecodeStatus status = ExifDecodeStatus::Ok;

    ExifDecodeStatus ifd0_status     = ExifDecodeStatus::Ok;
    ExifDecodeStatus exif_ifd_status = ExifDecodeStatus::Ok;
    ExifDecodeStatus gps_ifd_status  = ExifDecodeStatus::Ok;
    bool exif_ifd_found              = false;
    bool gps_ifd_found               = false;

    uint32_t ifds_decoded    = 0;
    uint32_t entries_decoded = 0;

    /// TIFF PhotometricInterpretation from IFD0 (0 when absent).
    uint16_t photometric = 0;

    // Payloads embedded in IFD0 (TIFF files), relative to the TIFF bytes.
    // Tag 33723 (IPTC-NAA) and tag 700 (XMP). Size 0 when absent.
    uint64_t iptc_offset = 0;
    uint64_t iptc_size   = 0;
    uint64_t xmp_offset  = 0;
    uint64_t xmp_size    = 0;
};

/**
 * \brief Decodes a TIFF header + IFD0, the EXIF IFD and the GPS IFD into
 * \p model.
 *
 * Supports classic TIFF and BigTIFF in either byte order. Each IFD is decoded
 * independently: a malformed GPS IFD leaves \ref MetadataModel::gps absent and
 * does not affect the device, timestamp or camera-settings categories. Entries
 * whose value lies outside \p tiff_bytes are skipped.
 *
 * Category optionals in \p model are engaged only when at least one of their
 * tags is read (GPS: when the GPS IFD itself is readable). Thumbnail IFDs and
 * MakerNotes are not read.
 *
 * \param tiff_bytes TIFF header + IFD stream (from an EXIF blob or a TIFF file).
 * \param model Destination model (fields are assigned).
 * \param options Decode limits.
 */
ExifDecodeResult
decode_exif_tiff(std::span<const std::byte> tiff_bytes, MetadataModel& model,
                 const ExifDecodeOptions& options) noexcept;

/// Returns a short, stable name ("ok", "malformed", ...).
const char*
exif_decode_status_name(ExifDecodeStatus status) noexcept;

}  // namespace safemeta
