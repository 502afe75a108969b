#pragma once

#include "safemeta/metadata_model.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file container_scan.h
 * \brief Container detection and scanners that locate metadata blocks within
 * file bytes.
 */

namespace safemeta {

/// Scanner result status.
enum class ScanStatus : uint8_t {
    Ok,
    /// Output buffer was too small; \ref ScanResult::needed reports required size.
    OutputTruncated,
    /// The bytes do not match the container format handled by the scanner.
    Unsupported,
    /// The container structure is malformed or inconsistent.
    Malformed,
};

/// Container formats recognized by \ref detect_format.
enum class ContainerFormat : uint8_t {
    Unknown,
    Jpeg,
    Png,
    Webp,
    Gif,
    Tiff,
    Heif,
    Avif,
};

/// Logical kind of a discovered metadata block.
enum class ContainerBlockKind : uint8_t {
    Unknown,
    Exif,
    Xmp,
    XmpExtended,
    Icc,
    IptcIim,
    PhotoshopIrb,
    Mpf,
    Comment,
    /// PNG text chunk that is not one of the recognized profiles below.
    Text,
    /// ImageMagick "Raw profile type exif/APP1" hex text (PNG text chunk).
    RawProfileExif,
    /// ImageMagick "Raw profile type iptc/8bim" hex text (PNG text chunk).
    RawProfileIptc,
    /// Any other APPn segment or unknown ancillary chunk.
    Vendor,
};

/// Compression type for the block payload bytes (if any).
enum class BlockCompression : uint8_t {
    None,
    Deflate,
};

/**
 * \brief Reference to a metadata payload within container bytes.
 *
 * All offsets are relative to the start of the full file byte buffer passed to
 * the scanner. Scanners locate blocks and annotate compression; they do not
 * decompress or parse the inner formats.
 */
struct ContainerBlockRef final {
    ContainerFormat format       = ContainerFormat::Unknown;
    ContainerBlockKind kind      = ContainerBlockKind::Unknown;
    BlockCompression compression = BlockCompression::None;

    // The outer container block (JPEG segment, PNG chunk, RIFF chunk).
    uint64_t outer_offset = 0;
    uint64_t outer_size   = 0;

    // The metadata bytes inside the block (after signatures/prefix fields).
    uint64_t data_offset = 0;
    uint64_t data_size   = 0;

    // Container-specific identifier:
    // - JPEG: marker (0xFFEx)
    // - PNG: chunk type (FourCC)
    // - RIFF/WebP: chunk type (FourCC)
    // - TIFF: 0
    uint32_t id = 0;
};

struct ScanResult final {
    ScanStatus status = ScanStatus::Ok;
    uint32_t written  = 0;
    uint32_t needed   = 0;
};

/// Dimensions and color model read from the container's pixel header
/// (JPEG SOFn, PNG IHDR, WebP VP8X/VP8/VP8L).
struct PixelHeader final {
    uint32_t width         = 0;
    uint32_t height        = 0;
    ColorModel color_model = ColorModel::Unknown;
    bool has_alpha         = false;
};

/// Packs four ASCII characters into a big-endian FourCC integer.
static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}


/// Identifies the container from its leading signature bytes.
ContainerFormat
detect_format(std::span<const std::byte> bytes) noexcept;

/// Returns a short, stable name ("jpeg", "png", ...).
const char*
container_format_name(ContainerFormat format) noexcept;

/// Returns a short, stable name ("ok", "output_truncated", ...).
const char*
scan_status_name(ScanStatus status) noexcept;

/// Returns a short, stable name for a block kind.
const char*
container_block_kind_name(ContainerBlockKind kind) noexcept;

/// Dispatches to the scanner matching \ref detect_format.
/// GIF/HEIF/AVIF are recognized but report \ref ScanStatus::Unsupported.
ScanResult
scan_auto(std::span<const std::byte> bytes,
          std::span<ContainerBlockRef> out) noexcept;

/// Scans a JPEG byte stream and returns all metadata segments found, including
/// APPn/COM segments that follow the first scan.
ScanResult
scan_jpeg(std::span<const std::byte> bytes,
          std::span<ContainerBlockRef> out) noexcept;
/// Scans a PNG byte stream and returns all ancillary metadata chunks found.
ScanResult
scan_png(std::span<const std::byte> bytes,
         std::span<ContainerBlockRef> out) noexcept;
/// Scans a RIFF/WebP byte stream and returns all metadata chunks found.
ScanResult
scan_webp(std::span<const std::byte> bytes,
          std::span<ContainerBlockRef> out) noexcept;
/// Scans a TIFF byte stream; the whole file is exposed as an EXIF/TIFF-IFD block.
ScanResult
scan_tiff(std::span<const std::byte> bytes,
          std::span<ContainerBlockRef> out) noexcept;

/// Reads dimensions and color model from the pixel header.
/// Returns false when the header is absent, truncated or the format has none.
bool
read_pixel_header(std::span<const std::byte> bytes, ContainerFormat format,
                  PixelHeader* out) noexcept;

}  // namespace safemeta
