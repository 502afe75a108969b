#pragma once

#include "safemeta/container_scan.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file container_payload.h
 * \brief Materializes the logical payload bytes of a scanned metadata block.
 */

namespace safemeta {

enum class PayloadStatus : uint8_t {
    Ok,
    /// The block uses an encoding this function does not handle.
    Unsupported,
    Malformed,
    LimitExceeded,
};

struct PayloadLimits final {
    /// Upper bound for the materialized payload (0 = unlimited).
    uint64_t max_output_bytes = 16ULL * 1024ULL * 1024ULL;
};

struct PayloadOptions final {
    PayloadLimits limits;
};

struct PayloadResult final {
    PayloadStatus status = PayloadStatus::Ok;
    uint64_t written     = 0;
};

/**
 * \brief Copies or inflates the data bytes of \p block into \p out.
 *
 * \ref BlockCompression::Deflate payloads are zlib streams (PNG zTXt, iTXt,
 * iCCP). \p out is replaced.
 */
PayloadResult
extract_payload(std::span<const std::byte> file_bytes,
                const ContainerBlockRef& block, std::vector<std::byte>* out,
                const PayloadOptions& options = PayloadOptions {}) noexcept;

/**
 * \brief Decodes an ImageMagick "Raw profile type" text body.
 *
 * Layout: `"\n" name "\n" spaces decimal_length "\n"` followed by hex digits
 * split across lines. \p out receives exactly `decimal_length` bytes.
 */
PayloadResult
decode_raw_profile_text(std::span<const std::byte> text,
                        std::vector<std::byte>* out,
                        const PayloadOptions& options = PayloadOptions {}) noexcept;

/// Returns a short, stable name ("ok", "malformed", ...).
const char*
payload_status_name(PayloadStatus status) noexcept;

}  // namespace safemeta
