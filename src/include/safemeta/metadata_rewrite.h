#pragma once

#include "safemeta/image_codec.h"
#include "safemeta/metadata_model.h"
#include "safemeta/metadata_read.h"
#include "safemeta/privacy_classify.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file metadata_rewrite.h
 * \brief Container rewriting: replaces every metadata segment of an image with
 * one safe EXIF segment while keeping the pixel payload byte-identical.
 */

namespace safemeta {

/// Rewrite outcome. Values mirror \ref CodecStatus.
enum class RewriteStatus : uint8_t {
    Ok,
    UnrecognizedFormat,
    UnsupportedFormat,
    UndecodablePayload,
    EncodeFailure,
};

struct RewriteResult final {
    RewriteStatus status   = RewriteStatus::Ok;
    ContainerFormat format = ContainerFormat::Unknown;
    /// Metadata segments or chunks left out of the output.
    uint32_t removed_blocks = 0;
    /// Size of the safe EXIF/TIFF stream written into the output.
    uint32_t exif_bytes = 0;
};

/**
 * \brief Re-serializes \p file_bytes with \p safe_model as its only metadata.
 *
 * \p safe_model is passed through \ref build_safe_metadata, so callers cannot
 * smuggle other categories into the output. On any status other than
 * \ref RewriteStatus::Ok, \p out is left empty.
 */
RewriteResult
rewrite_metadata(std::span<const std::byte> file_bytes,
                 const MetadataModel& safe_model, const ImageCodec& codec,
                 std::vector<std::byte>* out) noexcept;

/// \ref rewrite_metadata with \ref default_image_codec.
RewriteResult
rewrite_metadata(std::span<const std::byte> file_bytes,
                 const MetadataModel& safe_model,
                 std::vector<std::byte>* out) noexcept;

struct StripOptions final {
    MetadataReadOptions read;
    /// Codec used for the rewrite; null selects \ref default_image_codec.
    const ImageCodec* codec = nullptr;
};

struct StripResult final {
    /// Rewritten bytes, or the original bytes when \ref used_fallback is set.
    std::vector<std::byte> bytes;
    RewriteResult rewrite;
    MetadataReadReport report;
    PrivacyAnalysis analysis;
    /// True when the rewrite failed and \ref bytes holds the input unchanged.
    bool used_fallback = false;
};

/**
 * \brief Full pipeline for one image: parse, classify, build the safe model,
 * rewrite.
 *
 * Fail-open: when the rewrite fails, \ref StripResult::bytes is a copy of
 * \p file_bytes and \ref StripResult::used_fallback is set. Callers that
 * need a hard guarantee must check it.
 */
StripResult
strip_metadata(std::span<const std::byte> file_bytes,
               const StripOptions& options = StripOptions {}) noexcept;

/// Returns a short, stable name ("ok", "unsupported_format", ...).
const char*
rewrite_status_name(RewriteStatus status) noexcept;

}  // namespace safemeta
