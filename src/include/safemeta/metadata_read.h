#pragma once

#include "safemeta/container_payload.h"
#include "safemeta/container_scan.h"
#include "safemeta/exif_tiff_decode.h"
#include "safemeta/iptc_iim_decode.h"
#include "safemeta/metadata_model.h"
#include "safemeta/photoshop_irb_decode.h"
#include "safemeta/xmp_decode.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file metadata_read.h
 * \brief High-level "read" helper: scans a container and decodes its metadata
 * blocks into one \ref MetadataModel.
 */

namespace safemeta {

/// Outcome for one metadata category of a parsed image.
enum class BlockStatus : uint8_t {
    /// No block of this kind was found.
    Absent,
    Ok,
    /// The block was found but is structurally broken (fields may be partial).
    Malformed,
    LimitExceeded,
    /// The block was found but cannot be decoded in this build.
    Unsupported,
};

/// Full decoder option set for \ref read_metadata.
struct MetadataReadOptions final {
    ExifDecodeOptions exif;
    PayloadOptions payload;
    IptcIimDecodeOptions iptc;
    PhotoshopIrbDecodeOptions photoshop_irb;
    XmpDecodeOptions xmp;
    /// When false, XMP packets are located but not decoded.
    bool decode_xmp = true;
};

/// Per-category diagnostics of a \ref read_metadata call.
struct MetadataReadReport final {
    ContainerFormat format = ContainerFormat::Unknown;
    ScanResult scan;

    BlockStatus exif = BlockStatus::Absent;
    BlockStatus gps  = BlockStatus::Absent;
    BlockStatus iptc = BlockStatus::Absent;
    BlockStatus xmp  = BlockStatus::Absent;

    /// Number of metadata blocks the scanner reported.
    uint32_t blocks_found = 0;
    /// True when a pixel header supplied dimensions or color model.
    bool pixel_header_found = false;
};

struct MetadataReadResult final {
    MetadataModel model;
    MetadataReadReport report;
};

/**
 * \brief Parses \p file_bytes into a \ref MetadataModel.
 *
 * Never fails: unknown containers produce an empty model with
 * \ref MetadataReadReport::format set to \ref ContainerFormat::Unknown, and
 * broken sub-blocks degrade to absent categories.
 *
 * Decode order (and precedence):
 * 1. The first EXIF block (JPEG APP1, PNG eXIf or raw profile, WebP EXIF,
 *    TIFF file, Photoshop resource 0x0422).
 * 2. IPTC-IIM from Photoshop IRB (JPEG APP13), PNG raw profiles or TIFF tag
 *    33723.
 * 3. The first XMP packet, which only fills categories still absent.
 * 4. The container pixel header, which overrides dimensions and color model.
 */
MetadataReadResult
read_metadata(std::span<const std::byte> file_bytes,
              const MetadataReadOptions& options = MetadataReadOptions {}) noexcept;

/// Returns a short, stable name ("absent", "ok", "malformed", ...).
const char*
block_status_name(BlockStatus status) noexcept;

}  // namespace safemeta
