#pragma once

#include "safemeta/iptc_iim_decode.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file photoshop_irb_decode.h
 * \brief Decoder for Photoshop Image Resource Blocks (IRB / 8BIM resources).
 */

namespace safemeta {

/// Photoshop IRB decode result status.
enum class PhotoshopIrbDecodeStatus : uint8_t {
    Ok,
    /// The bytes do not look like an IRB stream.
    Unsupported,
    /// The stream is malformed or inconsistent.
    Malformed,
    /// Resource limits were exceeded.
    LimitExceeded,
};

/// Resource limits applied during IRB decode to bound hostile inputs.
struct PhotoshopIrbDecodeLimits final {
    uint32_t max_resources    = 1U << 12;
    uint64_t max_total_bytes  = 64ULL * 1024ULL * 1024ULL;
    uint32_t max_resource_len = 32U * 1024U * 1024U;
};

/// Decoder options for \ref decode_photoshop_irb.
struct PhotoshopIrbDecodeOptions final {
    PhotoshopIrbDecodeLimits limits;
    IptcIimDecodeOptions iptc;
};

struct PhotoshopIrbDecodeResult final {
    PhotoshopIrbDecodeStatus status = PhotoshopIrbDecodeStatus::Ok;
    uint32_t resources_decoded      = 0;

    /// True when resource 0x0404 (IPTC-NAA) was found.
    bool iptc_found                 = false;
    IptcIimDecodeStatus iptc_status = IptcIimDecodeStatus::Unsupported;

    // Resources 0x0422 (EXIF data 1) and 0x0424 (XMP), relative to the IRB
    // bytes. Size 0 when absent.
    uint64_t exif_offset = 0;
    uint64_t exif_size   = 0;
    uint64_t xmp_offset  = 0;
    uint64_t xmp_size    = 0;
};

/**
 * \brief Walks a Photoshop IRB stream and decodes its IPTC-IIM resource.
 *
 * IPTC-IIM is decoded from resource id 0x0404 (IPTC/NAA) into \p caption with
 * the semantics of \ref decode_iptc_iim. Embedded EXIF and XMP resources are
 * located but not decoded.
 */
PhotoshopIrbDecodeResult
decode_photoshop_irb(std::span<const std::byte> irb_bytes, CaptionBlock& caption,
                     const PhotoshopIrbDecodeOptions& options = PhotoshopIrbDecodeOptions {}) noexcept;

}  // namespace safemeta
