#pragma once

#include "safemeta/metadata_model.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * \file safe_metadata.h
 * \brief Allow-list builder for the metadata kept in a stripped image, and
 * its EXIF/TIFF serialization.
 */

namespace safemeta {

/// Fixed resolution written into every safe model (pixels per inch).
inline constexpr double kSafeResolutionDpi = 72.0;

/**
 * \brief Builds the safe subset of \p model.
 *
 * Kept: orientation (1 when absent or out of range) and each non-zero pixel
 * dimension that is present. Forced: \ref ColorModel::Rgb and a 72x72 dpi
 * \ref ResolutionBlock. Every other category is dropped.
 */
MetadataModel
build_safe_metadata(const MetadataModel& model) noexcept;

enum class SafeExifStatus : uint8_t {
    Ok,
    /// Null output pointer.
    InvalidArgument,
};

/**
 * \brief Serializes the safe subset of \p model as a big-endian TIFF stream.
 *
 * The model is passed through \ref build_safe_metadata first, so the output
 * only ever contains the allow-listed tags:
 * - IFD0: Orientation, XResolution, YResolution, ResolutionUnit,
 *   ExifIFDPointer.
 * - Exif IFD: ColorSpace (sRGB), then PixelXDimension and PixelYDimension,
 *   each only when that dimension is known.
 *
 * The output is deterministic, has no thumbnail IFD and no GPS IFD, and
 * replaces \p out. It carries no "Exif\0\0" preamble.
 */
SafeExifStatus
encode_safe_exif(const MetadataModel& model,
                 std::vector<std::byte>* out) noexcept;

}  // namespace safemeta
