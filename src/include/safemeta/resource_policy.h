#pragma once

#include "safemeta/container_payload.h"
#include "safemeta/exif_tiff_decode.h"
#include "safemeta/iptc_iim_decode.h"
#include "safemeta/metadata_read.h"
#include "safemeta/photoshop_irb_decode.h"
#include "safemeta/xmp_decode.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource-budget policy for SafeMeta read and strip workflows.
 */

namespace safemeta {

/**
 * \brief Storage-agnostic resource limits for untrusted image input.
 *
 * Decoder budgets bound the work done per metadata block; the file cap bounds
 * what the tools map in the first place.
 */
struct SafeMetaResourcePolicy final {
    /// Optional file mapping cap (0 = unlimited).
    uint64_t max_file_bytes = 0;

    /// Decompression and raw-profile budgets.
    PayloadLimits payload_limits;

    /// EXIF/TIFF decode budgets.
    ExifDecodeLimits exif_limits;

    /// XMP RDF/XML decode budgets.
    XmpDecodeLimits xmp_limits;

    /// IPTC-IIM decode budgets.
    IptcIimDecodeLimits iptc_limits;

    /// Photoshop IRB decode budgets.
    PhotoshopIrbDecodeLimits photoshop_irb_limits;
};

inline void
apply_resource_policy(const SafeMetaResourcePolicy& policy,
                      MetadataReadOptions* options) noexcept
{
    if (!options) {
        return;
    }
    options->exif.limits               = policy.exif_limits;
    options->payload.limits            = policy.payload_limits;
    options->xmp.limits                = policy.xmp_limits;
    options->iptc.limits               = policy.iptc_limits;
    options->photoshop_irb.limits      = policy.photoshop_irb_limits;
    options->photoshop_irb.iptc.limits = policy.iptc_limits;
}

}  // namespace safemeta
