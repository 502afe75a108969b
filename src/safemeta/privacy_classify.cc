#include "safemeta/privacy_classify.h"

namespace safemeta {

PrivacyAnalysis
classify_privacy(const MetadataModel& model) noexcept
{
    PrivacyAnalysis a;

    if (model.gps) {
        const GpsBlock& gps  = *model.gps;
        a.has_gps_data       = gps.tag_count > 0U || gps.latitude
                         || gps.longitude;
        a.has_exact_location = gps.latitude.has_value()
                               && gps.longitude.has_value();
    }
    if (model.device) {
        const DeviceBlock& d = *model.device;
        a.has_device_info    = d.make || d.model || d.software;
    }
    if (model.timestamps) {
        const TimestampBlock& t = *model.timestamps;
        a.has_timestamps        = t.original || t.digitized;
    }
    if (model.camera_settings) {
        const CameraSettingsBlock& c = *model.camera_settings;
        a.has_camera_settings        = c.lens_model || c.iso;
    }
    if (model.caption) {
        a.has_iptc_data = model.caption->dataset_count > 0U;
    }
    return a;
}


PrivacyAnalysis
analyze_privacy(std::span<const std::byte> file_bytes,
                const MetadataReadOptions& options) noexcept
{
    const MetadataReadResult read = read_metadata(file_bytes, options);
    return classify_privacy(read.model);
}


std::string
removed_data_description(const PrivacyAnalysis& analysis)
{
    const char* parts[4] = {};
    size_t n             = 0;
    if (analysis.has_gps_data) {
        parts[n++] = "location data";
    }
    if (analysis.has_device_info) {
        parts[n++] = "device information";
    }
    if (analysis.has_timestamps) {
        parts[n++] = "timestamps";
    }
    if (analysis.has_iptc_data) {
        parts[n++] = "embedded metadata";
    }
    if (n == 0) {
        return "No sensitive metadata detected";
    }

    std::string out = "Removed: ";
    for (size_t i = 0; i < n; ++i) {
        if (i != 0) {
            out.append(", ");
        }
        out.append(parts[i]);
    }
    return out;
}


const char*
risk_level_description(PrivacyRiskLevel level) noexcept
{
    switch (level) {
    case PrivacyRiskLevel::None: return "No privacy risk detected";
    case PrivacyRiskLevel::Low: return "Low privacy risk";
    case PrivacyRiskLevel::Medium: return "Medium privacy risk";
    case PrivacyRiskLevel::High:
        return "High privacy risk - exact location included";
    }
    return "No privacy risk detected";
}


const char*
privacy_risk_level_name(PrivacyRiskLevel level) noexcept
{
    switch (level) {
    case PrivacyRiskLevel::None: return "none";
    case PrivacyRiskLevel::Low: return "low";
    case PrivacyRiskLevel::Medium: return "medium";
    case PrivacyRiskLevel::High: return "high";
    }
    return "none";
}

}  // namespace safemeta
