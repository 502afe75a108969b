#pragma once

#include "safemeta/metadata_rewrite.h"
#include "safemeta/privacy_classify.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file batch_strip.h
 * \brief Index-preserving batch driver over \ref strip_metadata.
 */

namespace safemeta {

struct BatchOptions final {
    StripOptions strip;
    /// Worker threads (0 = hardware concurrency, 1 = run on the caller).
    uint32_t max_workers = 1;
};

/// Outcome for one input image.
struct BatchItem final {
    /// Rewritten bytes, or the original bytes when the rewrite failed.
    std::vector<std::byte> bytes;
    PrivacyAnalysis analysis;
    RewriteStatus status = RewriteStatus::Ok;
    bool used_fallback   = false;
};

struct BatchResult final {
    /// Aligned with the input: items[i] belongs to images[i].
    std::vector<BatchItem> items;
    /// Ascending indices whose rewrite failed.
    std::vector<size_t> failed_indices;
};

/**
 * \brief Strips every image in \p images.
 *
 * No item aborts the batch: a failed rewrite puts the original bytes into its
 * slot and its index into \ref BatchResult::failed_indices. Classification
 * runs for every item. With more than one worker, items are processed
 * concurrently; each worker writes only its own slots.
 */
BatchResult
strip_batch(std::span<const std::span<const std::byte>> images,
            const BatchOptions& options = BatchOptions {}) noexcept;

/// Category-wise OR over all items.
PrivacyAnalysis
overall_privacy_analysis(const BatchResult& result) noexcept;

/// True when at least one item failed its rewrite.
bool
has_processing_errors(const BatchResult& result) noexcept;

}  // namespace safemeta
