#include "safemeta/safe_metadata.h"

#include "safemeta/exif_tiff_decode.h"

#include "image_fixtures.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace safemeta {

using fixtures::view;

namespace {

    static MetadataModel camera_model()
    {
        MetadataModel m;
        m.orientation  = 6;
        m.pixel_width  = 4000;
        m.pixel_height = 3000;
        m.color_model  = ColorModel::Cmyk;
        GpsBlock gps;
        gps.latitude  = 1.0;
        gps.longitude = 2.0;
        gps.tag_count = 2;
        m.gps         = gps;
        DeviceBlock device;
        device.make      = "Canon";
        device.tag_count = 1;
        m.device         = device;
        CaptionBlock caption;
        caption.caption       = "secret";
        caption.dataset_count = 1;
        m.caption             = caption;
        return m;
    }

}  // namespace

TEST(SafeMetadata, KeepsOnlyAllowListedFields)
{
    const MetadataModel safe = build_safe_metadata(camera_model());
    EXPECT_EQ(safe.orientation.value_or(0), 6U);
    EXPECT_EQ(safe.pixel_width.value_or(0), 4000U);
    EXPECT_EQ(safe.pixel_height.value_or(0), 3000U);
    EXPECT_EQ(safe.color_model, ColorModel::Rgb);
    ASSERT_TRUE(safe.resolution.has_value());
    EXPECT_EQ(safe.resolution->unit, 2U);
    EXPECT_EQ(safe.resolution->x, kSafeResolutionDpi);
    EXPECT_EQ(safe.resolution->y, kSafeResolutionDpi);

    EXPECT_FALSE(safe.gps.has_value());
    EXPECT_FALSE(safe.device.has_value());
    EXPECT_FALSE(safe.timestamps.has_value());
    EXPECT_FALSE(safe.camera_settings.has_value());
    EXPECT_FALSE(safe.caption.has_value());
}


TEST(SafeMetadata, OrientationDefaultsToOne)
{
    MetadataModel m;
    EXPECT_EQ(build_safe_metadata(m).orientation.value_or(0), 1U);
    m.orientation = 9;
    EXPECT_EQ(build_safe_metadata(m).orientation.value_or(0), 1U);
    m.orientation = 0;
    EXPECT_EQ(build_safe_metadata(m).orientation.value_or(0), 1U);
    m.orientation = 8;
    EXPECT_EQ(build_safe_metadata(m).orientation.value_or(0), 8U);
}


TEST(SafeMetadata, DimensionsAreCopiedIndependently)
{
    MetadataModel m;
    m.pixel_width = 640;
    MetadataModel safe = build_safe_metadata(m);
    EXPECT_EQ(safe.pixel_width.value_or(0), 640U);
    EXPECT_FALSE(safe.pixel_height.has_value());

    m.pixel_height = 0;
    safe           = build_safe_metadata(m);
    EXPECT_EQ(safe.pixel_width.value_or(0), 640U);
    EXPECT_FALSE(safe.pixel_height.has_value());

    MetadataModel tall;
    tall.pixel_height = 480;
    safe              = build_safe_metadata(tall);
    EXPECT_FALSE(safe.pixel_width.has_value());
    EXPECT_EQ(safe.pixel_height.value_or(0), 480U);
}


TEST(SafeMetadata, ExifWithOneDimension)
{
    MetadataModel m;
    m.orientation = 3;
    m.pixel_width = 640;

    std::vector<std::byte> exif;
    ASSERT_EQ(encode_safe_exif(m, &exif), SafeExifStatus::Ok);
    EXPECT_EQ(exif.size(), 120U);

    MetadataModel decoded;
    const ExifDecodeResult r = decode_exif_tiff(view(exif), decoded,
                                                ExifDecodeOptions {});
    EXPECT_EQ(r.status, ExifDecodeStatus::Ok);
    EXPECT_EQ(decoded.orientation.value_or(0), 3U);
    EXPECT_EQ(decoded.pixel_width.value_or(0), 640U);
    EXPECT_FALSE(decoded.pixel_height.has_value());
}


TEST(SafeMetadata, ExifLayout)
{
    std::vector<std::byte> with_dims;
    ASSERT_EQ(encode_safe_exif(camera_model(), &with_dims), SafeExifStatus::Ok);
    EXPECT_EQ(with_dims.size(), 132U);
    EXPECT_EQ(with_dims[0], std::byte { 'M' });
    EXPECT_EQ(with_dims[1], std::byte { 'M' });
    EXPECT_EQ(with_dims[2], std::byte { 0x00 });
    EXPECT_EQ(with_dims[3], std::byte { 0x2A });
    EXPECT_EQ(fixtures::read_u32be_at(view(with_dims), 4), 8U);
    EXPECT_FALSE(fixtures::contains(view(with_dims), "Canon"));
    EXPECT_FALSE(fixtures::contains(view(with_dims), "secret"));

    std::vector<std::byte> without_dims;
    ASSERT_EQ(encode_safe_exif(MetadataModel {}, &without_dims),
              SafeExifStatus::Ok);
    EXPECT_EQ(without_dims.size(), 108U);
}


TEST(SafeMetadata, ExifDecodesBackToSafeModel)
{
    std::vector<std::byte> exif;
    ASSERT_EQ(encode_safe_exif(camera_model(), &exif), SafeExifStatus::Ok);

    MetadataModel decoded;
    const ExifDecodeResult r = decode_exif_tiff(view(exif), decoded,
                                                ExifDecodeOptions {});
    EXPECT_EQ(r.status, ExifDecodeStatus::Ok);
    EXPECT_TRUE(r.exif_ifd_found);
    EXPECT_FALSE(r.gps_ifd_found);

    EXPECT_EQ(decoded.orientation.value_or(0), 6U);
    EXPECT_EQ(decoded.pixel_width.value_or(0), 4000U);
    EXPECT_EQ(decoded.pixel_height.value_or(0), 3000U);
    ASSERT_TRUE(decoded.resolution.has_value());
    EXPECT_EQ(decoded.resolution->unit, 2U);
    EXPECT_DOUBLE_EQ(decoded.resolution->x, 72.0);
    EXPECT_DOUBLE_EQ(decoded.resolution->y, 72.0);
    EXPECT_FALSE(decoded.gps.has_value());
    EXPECT_FALSE(decoded.device.has_value());
}


TEST(SafeMetadata, EncodingIsDeterministic)
{
    std::vector<std::byte> a;
    std::vector<std::byte> b;
    ASSERT_EQ(encode_safe_exif(camera_model(), &a), SafeExifStatus::Ok);
    b.assign(7, std::byte { 0xEE });
    ASSERT_EQ(encode_safe_exif(build_safe_metadata(camera_model()), &b),
              SafeExifStatus::Ok);
    EXPECT_EQ(a, b);
}


TEST(SafeMetadata, NullOutput)
{
    EXPECT_EQ(encode_safe_exif(MetadataModel {}, nullptr),
              SafeExifStatus::InvalidArgument);
}

}  // namespace safemeta
