#include "safemeta/safe_metadata.h"

#include "byte_io_internal.h"

namespace safemeta {
namespace {

    using byte_io::append_ascii;
    using byte_io::append_u16be;
    using byte_io::append_u32be;

    enum TiffType : uint16_t {
        kTypeShort    = 3,
        kTypeLong     = 4,
        kTypeRational = 5,
    };

    constexpr uint16_t kTagOrientation    = 0x0112;
    constexpr uint16_t kTagXResolution    = 0x011A;
    constexpr uint16_t kTagYResolution    = 0x011B;
    constexpr uint16_t kTagResolutionUnit = 0x0128;
    constexpr uint16_t kTagExifIfd        = 0x8769;
    constexpr uint16_t kTagColorSpace     = 0xA001;
    constexpr uint16_t kTagPixelX         = 0xA002;
    constexpr uint16_t kTagPixelY         = 0xA003;

    constexpr uint32_t kIfd0Entries = 5;
    constexpr uint32_t kHeaderSize  = 8;


    static uint32_t ifd_size(uint32_t entries) noexcept
    {
        return 2U + entries * 12U + 4U;
    }


    static void append_entry_short(std::vector<std::byte>* out, uint16_t tag,
                                   uint16_t value)
    {
        append_u16be(out, tag);
        append_u16be(out, kTypeShort);
        append_u32be(out, 1);
        append_u16be(out, value);
        append_u16be(out, 0);
    }


    static void append_entry_long(std::vector<std::byte>* out, uint16_t tag,
                                  TiffType type, uint32_t value)
    {
        append_u16be(out, tag);
        append_u16be(out, type);
        append_u32be(out, 1);
        append_u32be(out, value);
    }

}  // namespace

MetadataModel
build_safe_metadata(const MetadataModel& model) noexcept
{
    MetadataModel safe;

    safe.orientation = 1;
    if (model.orientation && is_valid_orientation(*model.orientation)) {
        safe.orientation = *model.orientation;
    }
    if (model.pixel_width && *model.pixel_width != 0U) {
        safe.pixel_width = model.pixel_width;
    }
    if (model.pixel_height && *model.pixel_height != 0U) {
        safe.pixel_height = model.pixel_height;
    }
    safe.color_model = ColorModel::Rgb;

    ResolutionBlock res;
    res.unit        = 2;
    res.x           = kSafeResolutionDpi;
    res.y           = kSafeResolutionDpi;
    safe.resolution = res;
    return safe;
}


SafeExifStatus
encode_safe_exif(const MetadataModel& model,
                 std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return SafeExifStatus::InvalidArgument;
    }
    const MetadataModel safe = build_safe_metadata(model);

    const uint32_t exif_entries = 1U + (safe.pixel_width ? 1U : 0U)
                                  + (safe.pixel_height ? 1U : 0U);
    const uint32_t xres_off     = kHeaderSize + ifd_size(kIfd0Entries);
    const uint32_t yres_off     = xres_off + 8U;
    const uint32_t exif_off     = yres_off + 8U;

    out->clear();
    out->reserve(exif_off + ifd_size(exif_entries));

    // Header: big-endian classic TIFF, IFD0 right after it.
    append_ascii(out, "MM", 2);
    append_u16be(out, 42);
    append_u32be(out, kHeaderSize);

    // IFD0, tags in ascending order.
    append_u16be(out, static_cast<uint16_t>(kIfd0Entries));
    append_entry_short(out, kTagOrientation, *safe.orientation);
    append_entry_long(out, kTagXResolution, kTypeRational, xres_off);
    append_entry_long(out, kTagYResolution, kTypeRational, yres_off);
    append_entry_short(out, kTagResolutionUnit, safe.resolution->unit);
    append_entry_long(out, kTagExifIfd, kTypeLong, exif_off);
    append_u32be(out, 0);

    const uint32_t dpi = static_cast<uint32_t>(kSafeResolutionDpi);
    append_u32be(out, dpi);
    append_u32be(out, 1);
    append_u32be(out, dpi);
    append_u32be(out, 1);

    // Exif IFD.
    append_u16be(out, static_cast<uint16_t>(exif_entries));
    append_entry_short(out, kTagColorSpace, 1);
    if (safe.pixel_width) {
        append_entry_long(out, kTagPixelX, kTypeLong, *safe.pixel_width);
    }
    if (safe.pixel_height) {
        append_entry_long(out, kTagPixelY, kTypeLong, *safe.pixel_height);
    }
    append_u32be(out, 0);
    return SafeExifStatus::Ok;
}

}  // namespace safemeta
