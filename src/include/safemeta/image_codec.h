#pragma once

#include "safemeta/container_scan.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file image_codec.h
 * \brief Lossless container codec: splits a container into its pixel payload
 * and its metadata segments, and reassembles it with a new EXIF segment.
 */

namespace safemeta {

enum class CodecStatus : uint8_t {
    Ok,
    /// The container format could not be identified.
    UnrecognizedFormat,
    /// The format is recognized but cannot be rewritten (TIFF, GIF, HEIF,
    /// AVIF, animated WebP).
    UnsupportedFormat,
    /// The container structure needed to rebuild the pixels is broken.
    UndecodablePayload,
    /// The new metadata segment cannot be represented in the container.
    EncodeFailure,
};

/// Byte range within \ref DecodedImage::source.
struct PayloadPart final {
    uint64_t offset = 0;
    uint64_t size   = 0;
    /// JPEG marker, PNG/RIFF chunk FourCC, or 0 for entropy-coded data.
    uint32_t id = 0;
};

/**
 * \brief A container split into pixel payload and metadata parts.
 *
 * Parts reference \ref source, which must outlive the decoded image. The
 * concatenation of \ref pixel_parts, in order, is everything a decoder needs
 * to reconstruct the pixels. Encoding copies those bytes unchanged.
 */
struct DecodedImage final {
    ContainerFormat format = ContainerFormat::Unknown;
    std::span<const std::byte> source;
    std::vector<PayloadPart> pixel_parts;
    /// Segments and chunks that are dropped on encode.
    std::vector<PayloadPart> metadata_parts;

    uint32_t canvas_width  = 0;
    uint32_t canvas_height = 0;
    bool has_alpha         = false;
};

/// Pluggable pixel codec used by the container rewriter.
class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    /// Splits \p bytes into \p out. \p out is replaced.
    virtual CodecStatus decode(std::span<const std::byte> bytes,
                               DecodedImage* out) const noexcept
        = 0;

    /// Reassembles \p image with \p exif_tiff (a TIFF stream without the
    /// "Exif\0\0" preamble) as its only metadata. An empty \p exif_tiff
    /// writes no metadata segment. \p out is replaced.
    virtual CodecStatus encode(const DecodedImage& image,
                               std::span<const std::byte> exif_tiff,
                               std::vector<std::byte>* out) const noexcept
        = 0;
};

/**
 * \brief Default codec for JPEG, PNG and still WebP.
 *
 * - JPEG: keeps every non-APPn, non-COM marker segment, Adobe APP14, SOS and
 *   the entropy-coded data through EOI. The EXIF APP1 goes right after SOI.
 * - PNG: keeps IHDR, PLTE, tRNS, IDAT and IEND. The eXIf chunk goes before
 *   the first IDAT. APNG input is reduced to its default image.
 * - WebP: keeps ALPH, VP8 and VP8L, rebuilds VP8X and appends an EXIF chunk.
 */
class ContainerCodec final : public ImageCodec {
public:
    CodecStatus decode(std::span<const std::byte> bytes,
                       DecodedImage* out) const noexcept override;
    CodecStatus encode(const DecodedImage& image,
                       std::span<const std::byte> exif_tiff,
                       std::vector<std::byte>* out) const noexcept override;
};

/// Shared stateless \ref ContainerCodec instance.
const ImageCodec&
default_image_codec() noexcept;

/// Concatenates the pixel parts of \p image, in order.
std::vector<std::byte>
pixel_payload_bytes(const DecodedImage& image);

/// Returns a short, stable name ("ok", "unsupported_format", ...).
const char*
codec_status_name(CodecStatus status) noexcept;

}  // namespace safemeta
