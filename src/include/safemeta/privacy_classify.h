#pragma once

#include "safemeta/metadata_model.h"
#include "safemeta/metadata_read.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

/**
 * \file privacy_classify.h
 * \brief Privacy classification of a \ref MetadataModel.
 */

namespace safemeta {

/// Aggregate privacy risk, ordered from least to most sensitive.
enum class PrivacyRiskLevel : uint8_t {
    None,
    Low,
    Medium,
    High,
};

/// Which sensitive categories an image carries.
struct PrivacyAnalysis final {
    /// GPS block present and non-empty.
    bool has_gps_data = false;
    /// GPS block carries both latitude and longitude.
    bool has_exact_location = false;
    /// Make, model or software present.
    bool has_device_info = false;
    /// Original or digitized capture time present.
    bool has_timestamps = false;
    /// Lens model or ISO present. Tracked, not sensitive.
    bool has_camera_settings = false;
    /// Caption block present and non-empty.
    bool has_iptc_data = false;

    bool operator==(const PrivacyAnalysis&) const = default;
};

/// Classifies \p model. Pure; no I/O.
PrivacyAnalysis
classify_privacy(const MetadataModel& model) noexcept;

/// Parses \p file_bytes with \ref read_metadata and classifies the result.
/// Unrecognized containers yield an all-false analysis.
PrivacyAnalysis
analyze_privacy(std::span<const std::byte> file_bytes,
                const MetadataReadOptions& options = MetadataReadOptions {}) noexcept;

/// OR of GPS, device, timestamps and IPTC. Camera settings are excluded.
constexpr bool
has_sensitive_data(const PrivacyAnalysis& a) noexcept
{
    return a.has_gps_data || a.has_device_info || a.has_timestamps
           || a.has_iptc_data;
}

/**
 * \brief Risk level, first match wins:
 * exact location -> High; GPS or device -> Medium; timestamps or IPTC -> Low;
 * otherwise None.
 */
constexpr PrivacyRiskLevel
privacy_risk_level(const PrivacyAnalysis& a) noexcept
{
    if (a.has_exact_location) {
        return PrivacyRiskLevel::High;
    }
    if (a.has_gps_data || a.has_device_info) {
        return PrivacyRiskLevel::Medium;
    }
    if (a.has_timestamps || a.has_iptc_data) {
        return PrivacyRiskLevel::Low;
    }
    return PrivacyRiskLevel::None;
}

/// Category-wise OR of two analyses.
constexpr PrivacyAnalysis
merge_privacy_analysis(const PrivacyAnalysis& a,
                       const PrivacyAnalysis& b) noexcept
{
    PrivacyAnalysis r;
    r.has_gps_data        = a.has_gps_data || b.has_gps_data;
    r.has_exact_location  = a.has_exact_location || b.has_exact_location;
    r.has_device_info     = a.has_device_info || b.has_device_info;
    r.has_timestamps      = a.has_timestamps || b.has_timestamps;
    r.has_camera_settings = a.has_camera_settings || b.has_camera_settings;
    r.has_iptc_data       = a.has_iptc_data || b.has_iptc_data;
    return r;
}

/**
 * \brief Summary of the removed categories.
 *
 * Lists the present categories in the fixed order "location data",
 * "device information", "timestamps", "embedded metadata", joined by ", "
 * after the prefix "Removed: ". Returns "No sensitive metadata detected" when
 * none is present.
 */
std::string
removed_data_description(const PrivacyAnalysis& analysis);

/// Fixed sentence per level ("No privacy risk detected", ...).
const char*
risk_level_description(PrivacyRiskLevel level) noexcept;

/// Returns a short, stable name ("none", "low", "medium", "high").
const char*
privacy_risk_level_name(PrivacyRiskLevel level) noexcept;

}  // namespace safemeta
