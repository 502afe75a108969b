#pragma once

#include "safemeta/metadata_model.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file iptc_iim_decode.h
 * \brief Decoder for IPTC-IIM dataset streams into a \ref CaptionBlock.
 */

namespace safemeta {

/// IPTC-IIM decode result status.
enum class IptcIimDecodeStatus : uint8_t {
    Ok,
    /// The bytes do not look like an IPTC-IIM dataset stream.
    Unsupported,
    /// The stream is malformed or inconsistent.
    Malformed,
    /// Resource limits were exceeded.
    LimitExceeded,
};

/// Resource limits applied during IPTC-IIM decode to bound hostile inputs.
struct IptcIimDecodeLimits final {
    uint32_t max_datasets      = 16384;
    uint32_t max_dataset_bytes = 1U * 1024U * 1024U;
    uint64_t max_total_bytes   = 16ULL * 1024ULL * 1024ULL;
};

/// Decoder options for \ref decode_iptc_iim.
struct IptcIimDecodeOptions final {
    IptcIimDecodeLimits limits;
};

struct IptcIimDecodeResult final {
    IptcIimDecodeStatus status = IptcIimDecodeStatus::Ok;
    /// All datasets walked, any record.
    uint32_t datasets_decoded = 0;
};

/**
 * \brief Decodes an IPTC-IIM dataset stream into \p caption.
 *
 * Record 2 (application) datasets other than 2:00 (record version) count
 * toward \ref CaptionBlock::dataset_count; the common text datasets are also
 * copied into named fields. Keywords (2:25) accumulate; for the other fields
 * the first occurrence wins.
 *
 * \p caption is replaced only when the whole stream decodes; on any other
 * status it is left untouched.
 */
IptcIimDecodeResult
decode_iptc_iim(std::span<const std::byte> iptc_bytes, CaptionBlock& caption,
                const IptcIimDecodeOptions& options = IptcIimDecodeOptions {}) noexcept;

/// Returns a short, stable name ("ok", "malformed", ...).
const char*
iptc_iim_decode_status_name(IptcIimDecodeStatus status) noexcept;

}  // namespace safemeta
